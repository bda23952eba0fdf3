#pragma once

#include <nlohmann/json.hpp>

#include "pxid/common.hpp"
#include "pxid/core/identifier.hpp"

namespace pxid::core {

// nlohmann/json conversion: an identifier is stored as its text form.
// from_json throws std::invalid_argument when the text does not parse.
void to_json(nlohmann::json& j, const Identifier& id);
void from_json(const nlohmann::json& j, Identifier& id);

}  // namespace pxid::core

namespace pxid::interop {

// Non-throwing counterpart of from_json
Result<core::Identifier> tryIdentifierFromJson(const nlohmann::json& j);

// Descriptive object with every decoded field of the identifier
nlohmann::json identifierToJson(const core::Identifier& id);

}  // namespace pxid::interop
