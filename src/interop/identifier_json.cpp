#include "pxid/interop/identifier_json.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "pxid/util/clock.hpp"

namespace pxid::core {

void to_json(nlohmann::json& j, const Identifier& id) {
  j = id.toString();
}

void from_json(const nlohmann::json& j, Identifier& id) {
  auto parsed = interop::tryIdentifierFromJson(j);
  if (!parsed.has_value()) {
    throw std::invalid_argument(parsed.error().describe());
  }
  id = std::move(*parsed);
}

}  // namespace pxid::core

namespace pxid::interop {

Result<core::Identifier> tryIdentifierFromJson(const nlohmann::json& j) {
  if (!j.is_string()) {
    return makeErrorResult<core::Identifier>(
        ErrorCode::kInvalidArgument,
        std::string("Expected identifier string, got JSON ") + j.type_name());
  }
  return core::Identifier::parse(j.get_ref<const std::string&>());
}

nlohmann::json identifierToJson(const core::Identifier& id) {
  const auto machine_id = id.machineId();

  nlohmann::json result;
  result["id"] = id.toString();
  result["prefix"] = id.prefix();
  result["timestamp"] = id.timestamp();
  result["time"] = util::Time::toRfc3339(id.time());
  result["machine_id"] = fmt::format("{:02x}{:02x}{:02x}", machine_id[0], machine_id[1],
                                     machine_id[2]);
  result["process_id"] = id.processId();
  result["counter"] = id.counter();
  return result;
}

}  // namespace pxid::interop
