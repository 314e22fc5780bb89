#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tickflow {
namespace log {

/// Shared "tickflow" logger, created on first use (stdout, colored).
std::shared_ptr<spdlog::logger> get();

/// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off").
/// Throws std::invalid_argument for anything else.
void setLevel(const std::string& level);

} // namespace log
} // namespace tickflow

#define TICKFLOW_LOG_TRACE(...) ::tickflow::log::get()->trace(__VA_ARGS__)
#define TICKFLOW_LOG_DEBUG(...) ::tickflow::log::get()->debug(__VA_ARGS__)
#define TICKFLOW_LOG_INFO(...) ::tickflow::log::get()->info(__VA_ARGS__)
#define TICKFLOW_LOG_WARN(...) ::tickflow::log::get()->warn(__VA_ARGS__)
#define TICKFLOW_LOG_ERROR(...) ::tickflow::log::get()->error(__VA_ARGS__)
