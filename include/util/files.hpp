// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_UTIL_FILES_HPP
#define ANCHORSYNC_UTIL_FILES_HPP

#include <filesystem>

namespace anchorsync {
namespace util {

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.anchorsync on Unix
 */
std::filesystem::path get_default_datadir();

/**
 * Path of the sync database inside a data directory
 */
std::filesystem::path sync_db_path(const std::filesystem::path &datadir);

} // namespace util
} // namespace anchorsync

#endif // ANCHORSYNC_UTIL_FILES_HPP
