#include "logger.h"
#include <filesystem>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace iomux {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Console only until configure() runs
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("iomux", console_sink);
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [tid %t] [%s:%# %!] %v");
    logger_->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level_str) {
    if (level_str == "trace") return spdlog::level::trace;
    if (level_str == "debug") return spdlog::level::debug;
    if (level_str == "warn") return spdlog::level::warn;
    if (level_str == "error") return spdlog::level::err;
    if (level_str == "critical") return spdlog::level::critical;
    if (level_str == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logger::configure(bool console,
                       const std::string& file_path,
                       const std::string& level_str,
                       std::size_t max_size,
                       std::size_t max_files) {
    std::vector<spdlog::sink_ptr> sinks;

    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!file_path.empty()) {
        std::filesystem::path p(file_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path, max_size, max_files));
    }

    // Reuse the logger instance, replace its sinks
    logger_->sinks() = sinks;
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [tid %t] [%s:%# %!] %v");

    spdlog::level::level_enum level = parseLevel(level_str);
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);
}

void Logger::setLevel(spdlog::level::level_enum level) {
    logger_->set_level(level);
}

void Logger::setPattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

} // namespace iomux
