/**
 * @file CorruptFile.hpp
 * @brief Moves unreadable persisted documents out of the way
 */

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include "../utils/Logger.hpp"

namespace OptionsScalper {

/**
 * @brief Rename an unreadable file to <path>.corrupt, or <path>.corrupt.N if taken
 *
 * The next full rewrite of the document then starts from an empty state
 * without destroying what was on disk.
 *
 * @return True if the file was moved or no longer exists
 */
inline bool moveAsideCorruptFile(const std::string& path, Logger& logger) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return true;
    }

    fs::path target = path + ".corrupt";
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = path + ".corrupt." + std::to_string(n);
    }

    fs::rename(path, target, ec);
    if (ec) {
        logger.error("Could not move unreadable {} aside: {}", path, ec.message());
        return false;
    }
    logger.warn("Moved unreadable {} to {}", path, target.string());
    return true;
}

}  // namespace OptionsScalper
