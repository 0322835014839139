#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "configs/system_config.hpp"

namespace ReinvestTrader {
namespace Logging {

constexpr const char* RUN_LOG_DIRECTORY = "runtime_logs";
constexpr const char* LIVE_MODE_TAG = "LIVE";
constexpr const char* DRY_RUN_MODE_TAG = "DRY ";

/**
 * Log writer for one trading run. log_message() hands finished lines to
 * append(); the writer thread moves them to the console and the run's log
 * file so that a slow disk never delays an order.
 */
class AsyncLogger {
private:
    std::string run_log_path;
    bool echo_to_console;
    std::chrono::milliseconds wake_interval;

    std::mutex pending_mutex;
    std::condition_variable pending_signal;
    std::deque<std::string> pending_lines;
    std::atomic<bool> accepting{false};
    std::thread writer_thread;

    void writer_loop();
    void write_lines(std::deque<std::string>& lines, std::ofstream& run_log_stream);

public:
    AsyncLogger(const std::string& log_path, bool console_echo, int wake_interval_milliseconds);
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start();

    // Writes everything already appended, then joins the writer thread
    void stop();

    // Returns false once the logger is stopped; the caller then prints the line itself
    bool append(const std::string& formatted_line);

};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string mode_tag = LIVE_MODE_TAG;
};

// Single entry point for log lines. Without an installed context the line goes straight to stdout.
// A non-empty extra_file_path also appends the line to that file.
void log_message(const std::string& message, const std::string& extra_file_path);

// runtime_logs/<log_file>_<stamp>.log
std::string build_run_log_path(const std::string& log_file_base, const std::string& run_stamp);

// Creates the log directory, starts the writer and installs it in the context.
// Lines are tagged DRY in dry-run mode so a log never passes for a live run.
std::shared_ptr<AsyncLogger> start_run_logger(const Config::SystemConfig& config);
void stop_run_logger(AsyncLogger& logger);

LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace ReinvestTrader

#endif // ASYNC_LOGGER_HPP
