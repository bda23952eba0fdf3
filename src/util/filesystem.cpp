#include "pxid/util/filesystem.hpp"

#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace pxid::util {

namespace {

std::filesystem::path temporarySibling(const std::filesystem::path& target) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  auto temp_path = target;
  temp_path += ".tmp." + std::to_string(dis(gen));
  return temp_path;
}

void syncPath(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
}

}  // namespace

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  std::error_code ec;

  auto parent = path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  auto temp_path = temporarySibling(path);
  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create temporary file: " + temp_path.string()));
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      std::filesystem::remove(temp_path, ec);
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to write temporary file: " + temp_path.string()));
    }
  }

  syncPath(temp_path);

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  if (!parent.empty()) {
    syncPath(parent);
  }

  return {};
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }

  return content;
}

}  // namespace pxid::util
