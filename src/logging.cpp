#include "foundry/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace foundry {

void configure_logging(const std::string& level) {
    auto logger = spdlog::get("foundry");
    if (!logger) {
        logger = spdlog::stderr_color_mt("foundry");
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        spdlog::set_default_logger(logger);
    }
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only honour that when asked for.
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
        spdlog::warn("Unknown log level '{}', using info", level);
    }
    spdlog::set_level(lvl);
    logger->flush_on(spdlog::level::warn);
}

std::string summarize_for_log(const nlohmann::json& value, std::size_t max_len) {
    std::string s = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (s.size() > max_len) {
        s.resize(max_len);
        s += "...";
    }
    return s;
}

} // namespace foundry
