#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"

namespace attendance {

namespace {

const char* kPattern = "%Y-%m-%d %H:%M:%S.%e - %l - %v";

spdlog::level::level_enum parse_level(const std::string& level) {
    const auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigError("unknown log level: " + level);
    }
    return lvl;
}

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum lvl) {
    logger->set_pattern(kPattern);
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

}  // namespace

void setup_logging(const std::string& log_file, const std::string& level) {
    const auto lvl = parse_level(level);
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }
    install(std::make_shared<spdlog::logger>("attendance", sinks.begin(), sinks.end()), lvl);
}

void setup_stderr_logging(const std::string& level) {
    const auto lvl = parse_level(level);
    install(std::make_shared<spdlog::logger>("attendance",
                                             std::make_shared<spdlog::sinks::stderr_color_sink_mt>()),
            lvl);
}

}  // namespace attendance
