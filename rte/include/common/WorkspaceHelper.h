#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace RTE {

/**
 * @brief Filesystem helpers for per-invocation working directories
 */
class WorkspaceHelper {
public:
    /**
     * @brief Create a directory under parent that did not exist before this call
     *
     * The parent is created if needed. Each attempt asks nextName for a new
     * leaf name; a leaf that already exists belongs to someone else and is
     * never reused.
     *
     * @param error Receives the reason when no directory could be created
     * @return Path of the new directory, or nullopt
     */
    static std::optional<std::filesystem::path> createExclusiveDirectory(const std::filesystem::path &parent,
                                                                         const std::function<std::string()> &nextName,
                                                                         int maxAttempts, std::string &error) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "Failed to create directory " + parent.string() + ": " + ec.message();
            return std::nullopt;
        }

        for (int attempt = 0; attempt < maxAttempts; ++attempt) {
            std::filesystem::path candidate = parent / nextName();
            // create_directory() returns false without an error when the leaf already exists
            if (std::filesystem::create_directory(candidate, ec)) {
                return candidate;
            }
            if (ec) {
                error = "Failed to create directory " + candidate.string() + ": " + ec.message();
                return std::nullopt;
            }
        }

        error = "No unused directory name under " + parent.string() + " after " + std::to_string(maxAttempts) +
                " attempts";
        return std::nullopt;
    }

    /**
     * @brief Write content to path, replacing any previous file
     * @return false when the file could not be written completely
     */
    static bool writeTextFile(const std::filesystem::path &path, const std::string &content) {
        std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
        file << content;
        file.close();
        return static_cast<bool>(file);
    }
};

}  // namespace RTE
