#include <config/db_config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Roster {

namespace {

// First non-empty of the given environment variables
const char* env_first(const char* primary, const char* fallback) {
    const char* v = std::getenv(primary);
    if (v && *v) return v;
    if (fallback) {
        v = std::getenv(fallback);
        if (v && *v) return v;
    }
    return nullptr;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

DbConfig DbConfig::load_from_env() {
    DbConfig config;

    if (const char* v = env_first("DB_HOST", "PGHOST")) config.host = v;
    if (const char* v = env_first("DB_PORT", "PGPORT")) config.port = v;
    if (const char* v = env_first("DB_USER", "PGUSER")) config.user = v;
    else if (const char* v = std::getenv("USER")) config.user = v;

    // No password is fine: trust/ident auth or ~/.pgpass
    if (const char* v = env_first("DB_PASSWORD", "PGPASSWORD")) config.password = v;

    if (const char* v = env_first("DB_NAME", "PGDATABASE")) config.dbname = v;
    else throw std::runtime_error("DB_NAME (or PGDATABASE) environment variable is not set.");

    if (const char* v = env_first("DB_ADMIN_NAME", nullptr)) config.admin_dbname = v;

    if (const char* v = env_first("DB_CONNECT_TIMEOUT", nullptr)) {
        std::string s = trim(v);
        size_t pos = 0;
        int timeout = -1;
        try {
            timeout = std::stoi(s, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos != s.size() || timeout < 0) {
            throw std::runtime_error("DB_CONNECT_TIMEOUT must be a non-negative integer, got '" + s + "'");
        }
        config.connect_timeout = timeout;
    }

    return config;
}

std::string DbConfig::quote_conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string DbConfig::conninfo_for(const std::string& database) const {
    std::string conninfo;
    conninfo += "host=" + quote_conninfo_value(host);
    conninfo += " port=" + quote_conninfo_value(port);
    conninfo += " dbname=" + quote_conninfo_value(database);
    if (!user.empty()) conninfo += " user=" + quote_conninfo_value(user);
    if (!password.empty()) conninfo += " password=" + quote_conninfo_value(password);
    if (connect_timeout > 0) conninfo += " connect_timeout=" + std::to_string(connect_timeout);
    conninfo += " client_encoding=UTF8";
    return conninfo;
}

std::string DbConfig::to_conninfo() const {
    return conninfo_for(dbname);
}

std::string DbConfig::admin_conninfo() const {
    return conninfo_for(admin_dbname);
}

AppPaths AppPaths::load_from_env() {
    AppPaths paths;
    if (const char* v = env_first("SCHEMA_FILE", nullptr)) paths.schema_file = v;
    if (const char* v = env_first("SQL_FILE", nullptr)) paths.query_file = v;
    if (const char* v = env_first("INDEX_FILE", nullptr)) paths.index_file = v;
    if (const char* v = env_first("LOG_FILE", nullptr)) paths.log_file = v;
    if (const char* v = env_first("OUTPUT_DIR", nullptr)) paths.output_dir = v;
    return paths;
}

int load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return -1;
    }

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;

        if (entry.compare(0, 7, "export ") == 0) {
            entry = trim(entry.substr(7));
        }

        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str()) != nullptr) continue;

        if (::setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++count;
        }
    }

    return count;
}

} // namespace Roster
