// =================================================================
// include/Addonkit/SysInteraction.hpp
// =================================================================
// Defines the interface for filesystem operations used by the
// commands: reading and writing files, creating and removing paths.

#pragma once

#include <filesystem>
#include <string>

namespace Addonkit {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::filesystem::path& file_path) const;

    /**
     * @brief Writes content to a file, overwriting it. Content is written
     *        verbatim (binary mode), so line endings are the caller's choice.
     * @throws std::runtime_error if the file cannot be written.
     */
    void writeFile(const std::filesystem::path& file_path, const std::string& content) const;

    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::filesystem::path& file_path) const;

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::filesystem::path& dir_path) const;

    /**
     * @brief Creates a single directory.
     * @return False if the directory already exists or cannot be created.
     */
    bool createDirectory(const std::filesystem::path& dir_path) const;

    /**
     * @brief Creates a directory and any missing parents.
     * @throws std::filesystem::filesystem_error on failure.
     */
    void createDirectories(const std::filesystem::path& dir_path) const;

    /**
     * @brief Deletes a file, or a directory with everything below it.
     * @param path Path to delete. Symbolic links are removed, not followed.
     * @param ignore_missing When true a missing path is a successful no-op;
     *        otherwise it throws InvalidPathError.
     */
    void removePath(const std::filesystem::path& path, bool ignore_missing = false) const;
};

} // namespace Addonkit
