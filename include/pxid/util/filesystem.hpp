#pragma once

#include <filesystem>
#include <string>

#include "pxid/common.hpp"

namespace pxid::util {

// Filesystem utilities
class FileSystem {
 public:
  // Write to a temporary sibling, fsync, then rename over the target.
  // Missing parent directories are created.
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file with error handling
  static Result<std::string> readFile(const std::filesystem::path& path);
};

}  // namespace pxid::util
