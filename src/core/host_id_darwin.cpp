#include "pxid/core/host_id.hpp"

#include <sys/sysctl.h>
#include <sys/types.h>
#include <unistd.h>

#include "pxid/util/logging.hpp"

namespace pxid::core {

Result<std::string> readHostId() {
  char uuid[64] = {};
  size_t size = sizeof(uuid);
  if (sysctlbyname("kern.uuid", uuid, &size, nullptr, 0) == 0) {
    auto value = trimHostId(std::string(uuid));
    if (!value.empty()) {
      util::logger()->debug("Host id read from kern.uuid");
      return value;
    }
  }

  char hostname[256] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
    auto value = trimHostId(hostname);
    if (!value.empty()) {
      util::logger()->warn("kern.uuid unavailable, falling back to host name");
      return value;
    }
  }

  return makeErrorResult<std::string>(ErrorCode::kMachineIdUnavailable,
                                      "Neither kern.uuid nor a host name is available");
}

}  // namespace pxid::core
