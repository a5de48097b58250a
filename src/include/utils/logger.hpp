/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * 1.  Calls from application threads (e.g. `LOGGER_INFO(...)`) format the
 *     message on the calling thread and push a command onto a queue. The relay
 *     and dispatcher threads never block on log I/O.
 * 2.  A single worker thread is the sole consumer of the queue. It owns the
 *     active sink and performs all writes, so sinks need no locking.
 * 3.  Sinks: console (stderr), file (optionally flock-protected so several
 *     plugin processes can share one file), syslog.
 * 4.  `shutdown()` drains the queue before returning; `flush()` blocks until
 *     every message queued before the call has been written.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("Relay: connected to {}", endpoint);
 *
 * auto &logger = gwbridge::utils::Logger::instance();
 * logger.set_logfile("/var/log/gwbridge-mqtt.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // before main() returns
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "gwbridge_core_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace gwbridge::utils
{

struct LoggerImpl;

class GWBRIDGE_CORE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink changes are commands executed in order by the worker thread.

    /** @brief Switch logging to stderr. Non-blocking. */
    void set_console();

    /**
     * @brief Switch logging to a file (append mode). Non-blocking.
     * @param utf8_path Path to the log file.
     * @param use_flock Take an advisory lock around each write.
     */
    void set_logfile(const std::string &utf8_path, bool use_flock = false);

    /**
     * @brief Switch logging to syslog. Non-blocking.
     * @param ident The identity passed to openlog(); empty means program name.
     */
    void set_syslog(const std::string &ident = {}, int option = 0, int facility = 0);

    /**
     * @brief Drain the queue, flush the sink and stop the worker thread.
     * Messages logged afterwards go straight to stderr. Idempotent.
     */
    void shutdown();

    /** @brief Block until every message queued before this call is written. */
    void flush();

    // --- Level ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /** @brief "trace", "debug", "info", "warn"/"warning", "error", "system". */
    [[nodiscard]] static std::optional<Level> parse_level(std::string_view name) noexcept;
    [[nodiscard]] static const char *level_name(Level lvl) noexcept;

    /**
     * @brief Callback for sink creation or write failures.
     * Invoked on a helper thread, never on the worker, so it may log.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    [[nodiscard]] bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace gwbridge::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::gwbridge::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::gwbridge::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::gwbridge::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::gwbridge::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::gwbridge::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::gwbridge::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
