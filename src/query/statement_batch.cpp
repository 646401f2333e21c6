#include <query/statement_batch.hpp>
#include <utils/file_io.hpp>
#include <cctype>

namespace Roster {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

void finish_statement(std::vector<std::string>& out, const std::string& text, bool has_code) {
    if (!has_code) return;
    std::string stmt = trim(text);
    if (!stmt.empty()) out.push_back(std::move(stmt));
}

bool is_ident_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

// E'...' or e'...': the quote at sql[quote] opens a string with backslash escapes
bool starts_escape_string(const std::string& sql, size_t quote) {
    if (quote == 0 || (sql[quote - 1] != 'E' && sql[quote - 1] != 'e')) return false;
    return quote == 1 || !is_ident_char(sql[quote - 2]);
}

// "$$" or "$tag$" starting at sql[i], else empty ($1 parameters are not tags)
std::string dollar_tag_at(const std::string& sql, size_t i) {
    size_t j = i + 1;
    if (j < sql.size() && std::isdigit(static_cast<unsigned char>(sql[j]))) return {};
    while (j < sql.size() && sql[j] != '$') {
        unsigned char u = static_cast<unsigned char>(sql[j]);
        if (!(std::isalnum(u) || sql[j] == '_' || u >= 0x80)) return {};
        ++j;
    }
    if (j >= sql.size()) return {};
    return sql.substr(i, j - i + 1);
}

} // namespace

std::vector<std::string> split_statements(const std::string& sql) {
    enum class State { Code, SingleQuote, EscapeQuote, DoubleQuote, DollarQuote, LineComment, BlockComment };

    std::vector<std::string> statements;
    std::string current;
    std::string dollar_tag;  // "$$" or "$name$" while inside a dollar-quoted body
    bool has_code = false;   // anything besides whitespace and comments
    State state = State::Code;

    for (size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];
        char next = (i + 1 < sql.size()) ? sql[i + 1] : '\0';

        switch (state) {
            case State::Code:
                if (c == ';') {
                    finish_statement(statements, current, has_code);
                    current.clear();
                    has_code = false;
                    continue;
                }
                if (c == '-' && next == '-') {
                    state = State::LineComment;
                } else if (c == '/' && next == '*') {
                    state = State::BlockComment;
                    current += c;
                    current += next;
                    ++i;
                    continue;
                } else if (c == '\'') {
                    state = starts_escape_string(sql, i) ? State::EscapeQuote : State::SingleQuote;
                    has_code = true;
                } else if (c == '"') {
                    state = State::DoubleQuote;
                    has_code = true;
                } else if (c == '$' && !(i > 0 && is_ident_char(sql[i - 1]))) {
                    dollar_tag = dollar_tag_at(sql, i);
                    has_code = true;
                    if (!dollar_tag.empty()) {
                        state = State::DollarQuote;
                        current += dollar_tag;
                        i += dollar_tag.size() - 1;
                        continue;
                    }
                } else if (!std::isspace(static_cast<unsigned char>(c))) {
                    has_code = true;
                }
                break;
            case State::SingleQuote:
                // '' is an escaped quote and re-enters the literal on the next char
                if (c == '\'') state = State::Code;
                break;
            case State::EscapeQuote:
                if (c == '\\' && next != '\0') {
                    current += c;
                    current += next;
                    ++i;
                    continue;
                }
                if (c == '\'') state = State::Code;
                break;
            case State::DoubleQuote:
                if (c == '"') state = State::Code;
                break;
            case State::DollarQuote:
                if (c == '$' && sql.compare(i, dollar_tag.size(), dollar_tag) == 0) {
                    state = State::Code;
                    current += dollar_tag;
                    i += dollar_tag.size() - 1;
                    continue;
                }
                break;
            case State::LineComment:
                if (c == '\n') state = State::Code;
                break;
            case State::BlockComment:
                if (c == '*' && next == '/') {
                    state = State::Code;
                    current += c;
                    current += next;
                    ++i;
                    continue;
                }
                break;
        }

        current += c;
    }

    finish_statement(statements, current, has_code);
    return statements;
}

std::vector<std::string> read_statement_file(const std::string& path) {
    return split_statements(read_file_content(path));
}

} // namespace Roster
