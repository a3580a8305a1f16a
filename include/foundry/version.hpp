#pragma once
#include <string_view>

namespace foundry {

constexpr std::string_view LIBRARY_VERSION       = "0.1.0";
constexpr std::string_view TOOL_PROTOCOL_VERSION = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION       = "2.0";
constexpr std::string_view ANTHROPIC_API_VERSION = "2023-06-01";

} // namespace foundry
