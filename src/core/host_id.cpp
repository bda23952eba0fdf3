#include "pxid/core/host_id.hpp"

namespace pxid::core {

std::string trimHostId(const std::string& raw) {
  constexpr const char* kWhitespace = " \t\r\n\v\f";
  auto first = raw.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  auto last = raw.find_last_not_of(kWhitespace);
  return raw.substr(first, last - first + 1);
}

}  // namespace pxid::core
