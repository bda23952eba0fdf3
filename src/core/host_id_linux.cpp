#include "pxid/core/host_id.hpp"

#include <array>

#include <unistd.h>

#include "pxid/util/filesystem.hpp"
#include "pxid/util/logging.hpp"

namespace pxid::core {

namespace {

constexpr std::array<const char*, 3> kHostIdFiles = {
    "/etc/machine-id",
    "/var/lib/dbus/machine-id",
    "/sys/class/dmi/id/product_uuid",
};

}  // namespace

Result<std::string> readHostId() {
  for (const char* path : kHostIdFiles) {
    auto content = util::FileSystem::readFile(path);
    if (!content.has_value()) {
      util::logger()->debug("Host id source {} unavailable: {}", path, content.error().message());
      continue;
    }

    auto value = trimHostId(*content);
    if (!value.empty()) {
      util::logger()->debug("Host id read from {}", path);
      return value;
    }
  }

  char hostname[256] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
    auto value = trimHostId(hostname);
    if (!value.empty()) {
      util::logger()->warn("No machine id file found, falling back to host name");
      return value;
    }
  }

  return makeErrorResult<std::string>(ErrorCode::kMachineIdUnavailable,
                                      "No machine id file or host name available");
}

}  // namespace pxid::core
