#pragma once

#include <stdexcept>
#include <string>

namespace Roster {

/**
 * SQLSTATE codes the loader and provisioner branch on.
 */
namespace SqlState {
inline constexpr char DuplicateDatabase[] = "42P04";
inline constexpr char UndefinedTable[]    = "42P01";
} // namespace SqlState

/**
 * @brief Failure reported by the backend or the client library.
 *
 * sqlstate() is empty when there was no server diagnostic (connection
 * refused, connection lost mid-statement).
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message, std::string sqlstate = {})
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }

    bool is(const char* code) const { return sqlstate_ == code; }

private:
    std::string sqlstate_;
};

} // namespace Roster
