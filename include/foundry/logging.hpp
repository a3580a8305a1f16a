#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace foundry {

/// Install the process-wide "foundry" logger (stderr, coloured) as the
/// spdlog default and set its level ("trace" .. "off"). Safe to call twice.
void configure_logging(const std::string& level);

/// Compact, size-capped rendering of tool arguments for log lines.
[[nodiscard]] std::string summarize_for_log(const nlohmann::json& value, std::size_t max_len = 200);

} // namespace foundry
