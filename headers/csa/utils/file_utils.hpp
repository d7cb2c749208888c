#ifndef CODESTRUCTUREANALYZER_FILE_UTILS_HPP
#define CODESTRUCTUREANALYZER_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File reading used by the path-based entry points.
 *
 * These are the only places where the engine touches the file system.
 * Failures come back as Result errors and are handed to the caller
 * unchanged.
 */

#include "csa/result.hpp"
#include "csa/error.hpp"

#include <string>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace csa::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents, NotFound if the file does not exist, or
     *         IoError if it cannot be opened or read.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        if (std::error_code ec; fs::is_directory(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::io_error("Path is a directory", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

}  // namespace csa::file_utils

#endif //CODESTRUCTUREANALYZER_FILE_UTILS_HPP
