// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <system_error>

namespace anchorsync {
namespace util {

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".anchorsync";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".anchorsync";
}

std::filesystem::path sync_db_path(const std::filesystem::path &datadir) {
  return datadir / "sync.db";
}

} // namespace util
} // namespace anchorsync
