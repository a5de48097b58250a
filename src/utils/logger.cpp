/**
 * @file logger.cpp
 * @brief Asynchronous logger: callers queue commands, one worker owns the sink.
 *
 * Every public call becomes a `LoggerCommand` (a record to write, a sink swap,
 * a flush barrier ...). The worker takes the whole pending vector in one swap
 * and runs it outside the lock. Write errors are handed to an `ErrorReporter`
 * thread so that a handler which logs cannot stall the worker. After
 * shutdown() records go straight to stderr.
 */

#include "utils/logger.hpp"
#include "utils/format_tools.hpp"
#include "utils/mailbox.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/syscall.h>
#include <syslog.h>
#include <unistd.h>

namespace gwbridge::utils
{

// ============================================================================
// Records and sinks
// ============================================================================

struct LogRecord
{
    Logger::Level level;
    std::chrono::system_clock::time_point when;
    uint64_t tid;
    std::string text;
};

namespace
{

uint64_t current_tid() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/// "[2025-01-01 12:00:00.123456] [INFO  ] [ 4711] Relay: ...\n"
std::string render(const LogRecord &rec)
{
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", format_tools::formatted_time(rec.when),
                       Logger::level_name(rec.level), rec.tid, rec.text);
}

LogRecord internal_record(std::string text)
{
    return LogRecord{Logger::Level::L_SYSTEM, std::chrono::system_clock::now(), current_tid(),
                     std::move(text)};
}

int syslog_priority(Logger::Level level) noexcept
{
    switch (level)
    {
    case Logger::Level::L_TRACE:
    case Logger::Level::L_DEBUG: return LOG_DEBUG;
    case Logger::Level::L_INFO: return LOG_INFO;
    case Logger::Level::L_WARNING: return LOG_WARNING;
    case Logger::Level::L_ERROR: return LOG_ERR;
    case Logger::Level::L_SYSTEM: return LOG_CRIT;
    }
    return LOG_INFO;
}

} // namespace

/// A log destination. Owned and driven only by the logger's worker thread.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void put(const LogRecord &rec) = 0;
    virtual void sync() = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

class StderrSink final : public Sink
{
  public:
    void put(const LogRecord &rec) override { fmt::print(stderr, "{}", render(rec)); }
    void sync() override { std::fflush(stderr); }
    [[nodiscard]] std::string name() const override { return "stderr"; }
};

/// Append-only file; with @p lock_each_write several processes can share it.
class AppendFileSink final : public Sink
{
  public:
    AppendFileSink(std::string path, bool lock_each_write)
        : m_path(std::move(path)), m_lock(lock_each_write)
    {
        m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (m_fd < 0)
        {
            throw std::runtime_error(
                fmt::format("cannot open log file '{}': errno {}", m_path, errno));
        }
    }

    ~AppendFileSink() override { ::close(m_fd); }

    AppendFileSink(const AppendFileSink &) = delete;
    AppendFileSink &operator=(const AppendFileSink &) = delete;

    void put(const LogRecord &rec) override
    {
        const std::string line = render(rec);
        if (m_lock)
            ::flock(m_fd, LOCK_EX);
        const bool complete = write_all(line);
        if (m_lock)
            ::flock(m_fd, LOCK_UN);
        if (!complete)
            throw std::runtime_error(fmt::format("write to '{}' failed: errno {}", m_path, errno));
    }

    void sync() override { ::fsync(m_fd); }

    [[nodiscard]] std::string name() const override { return "file " + m_path; }

  private:
    bool write_all(std::string_view data) const
    {
        while (!data.empty())
        {
            const ssize_t n = ::write(m_fd, data.data(), data.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return false;
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return true;
    }

    std::string m_path;
    bool m_lock;
    int m_fd = -1;
};

class SyslogSink final : public Sink
{
  public:
    SyslogSink(std::string ident, int option, int facility) : m_ident(std::move(ident))
    {
        // openlog() keeps the pointer, so the string lives as long as the sink.
        ::openlog(m_ident.empty() ? nullptr : m_ident.c_str(), option, facility);
    }

    ~SyslogSink() override { ::closelog(); }

    SyslogSink(const SyslogSink &) = delete;
    SyslogSink &operator=(const SyslogSink &) = delete;

    void put(const LogRecord &rec) override
    {
        ::syslog(syslog_priority(rec.level), "%.*s", static_cast<int>(rec.text.size()),
                 rec.text.data());
    }

    void sync() override {}

    [[nodiscard]] std::string name() const override
    {
        return m_ident.empty() ? std::string("syslog") : "syslog " + m_ident;
    }

  private:
    std::string m_ident;
};

// ============================================================================
// Worker commands
// ============================================================================

struct SwapSink
{
    std::unique_ptr<Sink> sink;
};

struct SinkFailed
{
    std::string reason;
};

/// Completes once everything queued before it has reached the sink.
struct FlushBarrier
{
    std::shared_ptr<std::promise<void>> done;
};

struct InstallErrorHandler
{
    std::function<void(const std::string &)> handler;
};

using LoggerCommand = std::variant<LogRecord, SwapSink, SinkFailed, FlushBarrier, InstallErrorHandler>;

/**
 * Runs the write-error handler on its own thread so that a handler which
 * logs never waits on the worker that reported the error.
 */
class ErrorReporter
{
  public:
    ErrorReporter() : m_thread([this] { run(); }) {}
    ~ErrorReporter() { stop(); }

    ErrorReporter(const ErrorReporter &) = delete;
    ErrorReporter &operator=(const ErrorReporter &) = delete;

    void report(std::function<void(const std::string &)> handler, std::string message)
    {
        static_cast<void>(m_pending.send(Report{std::move(handler), std::move(message)}));
    }

    void stop()
    {
        m_pending.close();
        if (m_thread.joinable())
            m_thread.join();
    }

  private:
    struct Report
    {
        std::function<void(const std::string &)> handler;
        std::string message;
    };

    void run()
    {
        while (!m_pending.is_drained())
        {
            std::optional<Report> r = m_pending.receive_for(std::chrono::milliseconds(100));
            if (!r)
                continue;
            try
            {
                r->handler(r->message);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[gwbridge::Logger] write-error handler threw: {}\n", e.what());
            }
        }
    }

    Mailbox<Report> m_pending;
    std::thread m_thread;
};

// ============================================================================
// LoggerImpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl() : m_sink(std::make_unique<StderrSink>()), m_worker([this] { drain_loop(); }) {}

    // A Logger that was never shut down explicitly still drains its queue.
    ~LoggerImpl() { stop(); }

    LoggerImpl(const LoggerImpl &) = delete;
    LoggerImpl &operator=(const LoggerImpl &) = delete;

    void submit(LoggerCommand &&cmd);
    void stop();

    void drain_loop();
    void execute(LoggerCommand &cmd);
    void handle(LogRecord &rec);
    void handle(SwapSink &cmd);
    void handle(SinkFailed &cmd);
    void handle(FlushBarrier &cmd);
    void handle(InstallErrorHandler &cmd);
    void raise_error(std::string message);

    std::atomic<Logger::Level> m_level{Logger::Level::L_INFO};
    std::atomic<bool> m_stopping{false};

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::vector<LoggerCommand> m_pending;

    // Touched by the worker thread only.
    std::unique_ptr<Sink> m_sink;
    std::function<void(const std::string &)> m_error_handler;
    ErrorReporter m_reporter;

    std::thread m_worker; // last: started once everything above exists
};

void LoggerImpl::submit(LoggerCommand &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stopping.load(std::memory_order_acquire))
        {
            m_pending.push_back(std::move(cmd));
            m_wakeup.notify_one();
            return;
        }
    }
    // The worker is gone: write straight to stderr rather than lose the line.
    if (auto *rec = std::get_if<LogRecord>(&cmd))
        fmt::print(stderr, "[gwbridge::Logger-fallback] {}", render(*rec));
    else if (auto *barrier = std::get_if<FlushBarrier>(&cmd))
        barrier->done->set_value();
}

void LoggerImpl::raise_error(std::string message)
{
    if (m_error_handler)
        m_reporter.report(m_error_handler, std::move(message));
    else
        fmt::print(stderr, "[gwbridge::Logger] {}\n", message);
}

void LoggerImpl::handle(LogRecord &rec)
{
    if (rec.level >= m_level.load(std::memory_order_relaxed))
        m_sink->put(rec);
}

void LoggerImpl::handle(SwapSink &cmd)
{
    const std::string from = m_sink->name();
    const std::string to = cmd.sink->name();
    m_sink->put(internal_record("log output moving to " + to));
    m_sink->sync();
    m_sink = std::move(cmd.sink);
    m_sink->put(internal_record("log output moved here from " + from));
}

void LoggerImpl::handle(SinkFailed &cmd)
{
    raise_error(std::move(cmd.reason));
}

void LoggerImpl::handle(FlushBarrier &cmd)
{
    m_sink->sync();
    cmd.done->set_value();
}

void LoggerImpl::handle(InstallErrorHandler &cmd)
{
    m_error_handler = std::move(cmd.handler);
}

void LoggerImpl::execute(LoggerCommand &cmd)
{
    try
    {
        std::visit([this](auto &c) { handle(c); }, cmd);
    }
    catch (const std::exception &e)
    {
        // Never leave a flush() caller waiting on a barrier that failed.
        if (auto *barrier = std::get_if<FlushBarrier>(&cmd))
            barrier->done->set_value();
        raise_error(fmt::format("log sink error: {}", e.what()));
    }
}

void LoggerImpl::drain_loop()
{
    std::vector<LoggerCommand> batch;
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wakeup.wait(lock, [this] { return m_stopping.load() || !m_pending.empty(); });
            if (m_pending.empty())
                break; // stopping, nothing left
            batch.swap(m_pending);
        }
        for (auto &cmd : batch)
            execute(cmd);
        batch.clear();
    }
    m_sink->sync();
}

void LoggerImpl::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping.exchange(true))
            return;
    }
    m_wakeup.notify_one();
    if (m_worker.joinable())
        m_worker.join();
    // The worker was the only source of error reports.
    m_reporter.stop();
}

// ============================================================================
// Logger public API
// ============================================================================

namespace
{
std::unique_ptr<Logger> g_instance;
std::mutex g_instance_mutex;
} // namespace

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    if (!g_instance)
    {
        g_instance.reset(new Logger());
    }
    return *g_instance;
}

void Logger::set_console()
{
    pImpl->submit(SwapSink{std::make_unique<StderrSink>()});
}

void Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        pImpl->submit(SwapSink{std::make_unique<AppendFileSink>(utf8_path, use_flock)});
    }
    catch (const std::exception &e)
    {
        pImpl->submit(SinkFailed{e.what()});
    }
}

void Logger::set_syslog(const std::string &ident, int option, int facility)
{
    pImpl->submit(SwapSink{std::make_unique<SyslogSink>(ident, option, facility)});
}

void Logger::shutdown()
{
    pImpl->stop();
}

void Logger::flush()
{
    if (pImpl->m_stopping.load())
        return;

    auto barrier = std::make_shared<std::promise<void>>();
    std::future<void> done = barrier->get_future();
    pImpl->submit(FlushBarrier{barrier});
    done.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->m_level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->m_level.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

const char *Logger::level_name(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE: return "TRACE";
    case Level::L_DEBUG: return "DEBUG";
    case Level::L_INFO: return "INFO";
    case Level::L_WARNING: return "WARN";
    case Level::L_ERROR: return "ERROR";
    case Level::L_SYSTEM: return "SYSTEM";
    }
    return "UNK";
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->submit(InstallErrorHandler{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->m_level.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->submit(LogRecord{lvl, std::chrono::system_clock::now(), current_tid(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[gwbridge::Logger] failed to enqueue log line: {}\n", e.what());
    }
}

} // namespace gwbridge::utils
