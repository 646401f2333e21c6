#pragma once

#include <string>
#include <vector>

namespace Roster {

/**
 * @brief Split SQL text into statements on ';'.
 *
 * Fragments are trimmed and fragments holding nothing but whitespace or
 * comments are dropped; order is preserved. A ';' inside a quoted literal
 * (including E'...' with backslash escapes and $tag$ bodies), a quoted
 * identifier or a comment does not end a statement.
 */
std::vector<std::string> split_statements(const std::string& sql);

/**
 * @throws std::runtime_error if the file cannot be read
 */
std::vector<std::string> read_statement_file(const std::string& path);

} // namespace Roster
