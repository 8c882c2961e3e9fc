#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace dynsys {
namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return fs::create_directories(path);
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                    std::string("Error creating directory: ") + e.what());
        return false;
    }
}

std::string getProjectRoot() {
    std::string currentDir = fs::current_path().string();
    std::vector<std::string> possibleRoots = { currentDir };

    fs::path current(currentDir);
    for (int i = 0; i < 5; i++) {
        current = current.parent_path();
        if (!current.empty()) {
            possibleRoots.push_back(current.string());
        }
    }

    for (const auto& root : possibleRoots) {
        if (fs::exists(root + "/data") &&
            fs::exists(root + "/include") &&
            fs::exists(root + "/src")) {
            return fs::absolute(fs::path(root)).lexically_normal().string();
        }
    }

    return fs::absolute(fs::path(currentDir)).lexically_normal().string();
}

std::string getOutputPath(const std::string& filename) {
    fs::path outputDir = fs::path(getProjectRoot()) / "data" / "output";

    if (!ensureDirectoryExists(outputDir.string())) {
        Logger::getInstance().warning("FileUtils::getOutputPath",
                                      "Could not create output directory: " + outputDir.string());
    }

    if (filename.empty()) {
        return outputDir.lexically_normal().string();
    }
    return (outputDir / filename).lexically_normal().string();
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace FileUtils
} // namespace dynsys
