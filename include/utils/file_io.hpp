#pragma once

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Roster {

/**
 * @throws std::runtime_error naming the path if it cannot be read
 */
inline std::string read_file_content(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Could not read file: " + path);
    }
    return buffer.str();
}

/**
 * @brief Replace the file's contents.
 * @throws std::runtime_error naming the path if it cannot be written
 */
inline void write_file_content(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("Could not write file: " + path);
    }
}

} // namespace Roster
