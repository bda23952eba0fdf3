#include "pxid/util/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pxid::util {

std::uint32_t SystemClock::nowSeconds() const {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  return static_cast<std::uint32_t>(seconds);
}

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);

  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");

  return oss.str();
}

}  // namespace pxid::util
