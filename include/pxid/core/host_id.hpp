#pragma once

#include <string>

#include "pxid/common.hpp"

namespace pxid::core {

// Read a stable identifier for this host. Platform specific; the build
// selects one implementation. Returns kMachineIdUnavailable when no
// source yields a non-blank value.
Result<std::string> readHostId();

// Trim surrounding whitespace (host id files end in a newline)
std::string trimHostId(const std::string& raw);

}  // namespace pxid::core
