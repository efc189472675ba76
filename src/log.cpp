// filename: src/log.cpp
#include <core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <string>

spdlog::level::level_enum parse_log_level(std::string_view name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // from_str knows "warning"/"warn" and "error"/"err", and answers off for anything else
    const auto level = spdlog::level::from_str(s);
    if (level == spdlog::level::off || level == spdlog::level::critical) return spdlog::level::info;
    return level;
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("smql");
    if (!logger) logger = spdlog::stdout_color_mt("smql");
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}
