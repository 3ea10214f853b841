#pragma once

#include <memory>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace iomux {

/**
 * @brief Process-wide logger backed by spdlog.
 *
 * Console sink by default; configure() swaps in the sinks named by the
 * engine configuration (stdout and/or a rotating file).
 */
class Logger {
public:
    static Logger& instance();

    template <typename... Args>
    void info(const char* fmt, Args&&... args) {
        logger_->info(SPDLOG_FMT_RUNTIME(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(const char* fmt, Args&&... args) {
        logger_->warn(SPDLOG_FMT_RUNTIME(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(const char* fmt, Args&&... args) {
        logger_->error(SPDLOG_FMT_RUNTIME(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(const char* fmt, Args&&... args) {
        logger_->debug(SPDLOG_FMT_RUNTIME(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    void logWithLocation(spdlog::level::level_enum level,
                         const spdlog::source_loc& loc,
                         const char* fmt,
                         Args&&... args) {
        logger_->log(loc, level, SPDLOG_FMT_RUNTIME(fmt), std::forward<Args>(args)...);
    }

    bool shouldLog(spdlog::level::level_enum level) const { return logger_->should_log(level); }

    void setLevel(spdlog::level::level_enum level);
    void setPattern(const std::string& pattern);
    void configure(bool console,
                   const std::string& file_path,
                   const std::string& level,
                   std::size_t max_size,
                   std::size_t max_files);

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iomux

#define IOMUX_LOG_AT(level, fmt, ...) \
    ::iomux::Logger::instance().logWithLocation( \
        level, \
        spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, \
        fmt, ##__VA_ARGS__)

#define LOG_TRACE(fmt, ...) IOMUX_LOG_AT(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) IOMUX_LOG_AT(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) IOMUX_LOG_AT(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) IOMUX_LOG_AT(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) IOMUX_LOG_AT(spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) IOMUX_LOG_AT(spdlog::level::critical, fmt, ##__VA_ARGS__)
