#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace foundry {

/// Validate tool arguments against the subset of JSON Schema tool servers
/// actually use: type (string or list), required, properties, enum, items,
/// minimum/maximum, minLength/maxLength and additionalProperties=false.
/// Unknown keywords are ignored.
///
/// Returns nullopt when `value` conforms, otherwise the first violation as
/// a path-qualified message ("$.limit: expected integer").
[[nodiscard]] std::optional<std::string> validate_arguments(const nlohmann::json& schema,
                                                            const nlohmann::json& value);

} // namespace foundry
