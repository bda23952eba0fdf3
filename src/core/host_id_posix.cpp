#include "pxid/core/host_id.hpp"

#include <unistd.h>

#include "pxid/util/logging.hpp"

namespace pxid::core {

Result<std::string> readHostId() {
  char hostname[256] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
    auto value = trimHostId(hostname);
    if (!value.empty()) {
      util::logger()->debug("Host id taken from host name");
      return value;
    }
  }

  return makeErrorResult<std::string>(ErrorCode::kMachineIdUnavailable,
                                      "No host name available");
}

}  // namespace pxid::core
