#include "log/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace tickflow {
namespace log {

namespace {
std::once_flag g_init;
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::call_once(g_init, [] {
        g_logger = spdlog::get("tickflow");
        if (!g_logger) {
            g_logger = spdlog::stdout_color_mt("tickflow");
            g_logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            g_logger->set_level(spdlog::level::warn);
        }
    });
    return g_logger;
}

void setLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    get()->set_level(parsed);
}

} // namespace log
} // namespace tickflow
