#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

namespace dynsys {

/**
 * @namespace FileUtils
 * @brief Contains utilities for file and directory operations (configuration lookup, trajectory output).
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Locates and returns the project root directory.
     * @details Searches the current directory and up to five parents for one
     * holding data, include, and src directories. Falls back to the current directory.
     * @return Path to the project root directory as a string
     */
    std::string getProjectRoot();

    /**
     * @brief Constructs a path to the output directory (`<root>/data/output`) with optional filename.
     * @details Creates the output directory if it doesn't exist.
     * @param filename [in] Optional filename to append to the output path (empty by default)
     * @return Full path to the output directory or file as a string
     */
    std::string getOutputPath(const std::string& filename = "");

    /**
     * @brief Trims leading and trailing whitespace.
     */
    std::string trim(const std::string& text);
} // namespace FileUtils

} // namespace dynsys

#endif // FILE_UTILS_HPP
