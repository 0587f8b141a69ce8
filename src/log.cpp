#include "volmap/log.h"
#include "volmap/error.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace volmap {
namespace log {

namespace {

std::mutex                      g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(level);

    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern("%^[" + name + "]%$ %l: %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // anonymous namespace

void init(const std::string& stage, spdlog::level::level_enum level) {
    auto logger = make_logger("volmap:" + stage, level);
    std::lock_guard<std::mutex> lk(g_mutex);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lk(g_mutex);
    if (!g_logger) g_logger = make_logger("volmap", spdlog::level::info);
    return g_logger;
}

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level: " + name);
    }
    return level;
}

} // namespace log
} // namespace volmap
