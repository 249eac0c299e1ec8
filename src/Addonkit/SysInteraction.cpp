// =================================================================
// src/Addonkit/SysInteraction.cpp
// =================================================================
// Implementation for filesystem operations.

#include "Addonkit/SysInteraction.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace Addonkit {

std::string SysInteraction::readFile(const fs::path& file_path) const {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

void SysInteraction::writeFile(const fs::path& file_path, const std::string& content) const {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file for writing: " + file_path.string());
    }
    file_stream << content;
    file_stream.close();
    if (!file_stream) {
        throw std::runtime_error("Failed to write file: " + file_path.string());
    }
    LOG_DEBUG("Sys", "Wrote " + file_path.string());
}

bool SysInteraction::fileExists(const fs::path& file_path) const {
    std::error_code ec;
    return fs::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const fs::path& dir_path) const {
    std::error_code ec;
    return fs::is_directory(dir_path, ec);
}

bool SysInteraction::createDirectory(const fs::path& dir_path) const {
    std::error_code ec;
    bool created = fs::create_directory(dir_path, ec);
    if (ec) {
        LOG_DEBUG("Sys", "Cannot create " + dir_path.string(), ec.message());
        return false;
    }
    return created;
}

void SysInteraction::createDirectories(const fs::path& dir_path) const {
    fs::create_directories(dir_path);
}

void SysInteraction::removePath(const fs::path& path, bool ignore_missing) const {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);

    if (!fs::exists(status)) {
        if (ignore_missing) {
            return;
        }
        throw InvalidPathError("Invalid path: " + path.string());
    }

    if (fs::is_directory(status)) {
        fs::remove_all(path);
        LOG_DEBUG("Sys", "Removed directory " + path.string());
    } else if (fs::is_regular_file(status) || fs::is_symlink(status)) {
        fs::remove(path);
        LOG_DEBUG("Sys", "Removed file " + path.string());
    } else {
        throw InvalidPathError("Provided path neither references a file nor a directory: " + path.string());
    }
}

} // namespace Addonkit
