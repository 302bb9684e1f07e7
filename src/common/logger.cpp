#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace logkv {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> get_or_create(const std::string& name,
                                              spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
        logger->set_pattern(kPattern);
    }
    logger->set_level(level);
    return logger;
}

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    spdlog::set_default_logger(get_or_create("logkv", level));
}

std::shared_ptr<spdlog::logger> make_store_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    return get_or_create(name, level);
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace logkv
