#include "digitloom/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "digitloom/error.hpp"

namespace digitloom {
namespace logging {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum parse_level(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("unknown log level '" + level + "'", "DIGITLOOM_LOG_LEVEL");
    }
    return parsed;
}

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sinks.push_back(console_sink);
    if (!file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("digitloom", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger(spdlog::level::info, "");
    }
    return g_logger;
}

void init(const std::string& level, const std::string& file) {
    spdlog::level::level_enum parsed = parse_level(level);
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = make_logger(parsed, file);
}

void set_level(const std::string& level) {
    spdlog::level::level_enum parsed = parse_level(level);
    get()->set_level(parsed);
}

} // namespace logging
} // namespace digitloom
