#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace digitloom {
namespace logging {

// Process-wide "digitloom" logger. Created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> get();

// Rebuilds the logger with a stderr sink and, if file is non-empty, a file sink.
void init(const std::string& level = "info", const std::string& file = "");

// Accepts trace|debug|info|warn|error|critical|off. Throws ConfigError otherwise.
void set_level(const std::string& level);

} // namespace logging
} // namespace digitloom
