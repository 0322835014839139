#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ReinvestTrader {
namespace Logging {

namespace {

LoggingContext* installed_context = nullptr;

void print_to_console(const std::string& formatted_line) {
    if (installed_context) {
        std::lock_guard<std::mutex> console_guard(installed_context->console_mutex);
        std::cout << formatted_line << std::flush;
    } else {
        std::cout << formatted_line << std::flush;
    }
}

} // anonymous namespace

LoggingContext* get_logging_context() {
    return installed_context;
}

void set_logging_context(LoggingContext& context) {
    installed_context = &context;
}

void clear_logging_context() {
    installed_context = nullptr;
}

void log_message(const std::string& message, const std::string& extra_file_path) {
    if (!installed_context) {
        std::cout << message << std::endl;
        return;
    }

    std::ostringstream line_stream;
    line_stream << TimeUtils::get_current_human_readable_time() << " [" << installed_context->mode_tag << "]   "
                << message << "\n";
    std::string formatted_line = line_stream.str();

    std::shared_ptr<AsyncLogger> logger = installed_context->async_logger;
    if (!logger || !logger->append(formatted_line)) {
        print_to_console(formatted_line);
    }

    if (!extra_file_path.empty()) {
        std::ofstream extra_file_stream(extra_file_path, std::ios::app);
        if (extra_file_stream.is_open()) {
            extra_file_stream << formatted_line;
        } else {
            std::cerr << "ERROR: Failed to open log file: " << extra_file_path << std::endl;
        }
    }
}

std::string build_run_log_path(const std::string& log_file_base, const std::string& run_stamp) {
    std::string base_name = std::filesystem::path(log_file_base).filename().string();
    if (base_name.empty()) {
        base_name = "reinvest_trader";
    }
    return std::string(RUN_LOG_DIRECTORY) + "/" + base_name + "_" + run_stamp + ".log";
}

AsyncLogger::AsyncLogger(const std::string& log_path, bool console_echo, int wake_interval_milliseconds)
    : run_log_path(log_path), echo_to_console(console_echo), wake_interval(wake_interval_milliseconds > 0 ? wake_interval_milliseconds : 100) {}

AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::start() {
    if (accepting.exchange(true)) {
        return;
    }
    writer_thread = std::thread(&AsyncLogger::writer_loop, this);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> pending_guard(pending_mutex);
        accepting.store(false);
    }
    pending_signal.notify_all();
    if (writer_thread.joinable()) {
        writer_thread.join();
    }
}

bool AsyncLogger::append(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> pending_guard(pending_mutex);
        if (!accepting.load()) {
            return false;
        }
        pending_lines.push_back(formatted_line);
    }
    pending_signal.notify_one();
    return true;
}

void AsyncLogger::write_lines(std::deque<std::string>& lines, std::ofstream& run_log_stream) {
    for (const std::string& formatted_line : lines) {
        if (echo_to_console) {
            print_to_console(formatted_line);
        }
        if (run_log_stream.is_open()) {
            run_log_stream << formatted_line;
        }
    }
    run_log_stream.flush();
    lines.clear();
}

void AsyncLogger::writer_loop() {
    std::ofstream run_log_stream(run_log_path, std::ios::app);
    if (!run_log_stream.is_open()) {
        std::cerr << "ERROR: Failed to open run log: " << run_log_path << std::endl;
    }

    std::deque<std::string> ready_lines;
    bool keep_writing = true;
    while (keep_writing) {
        {
            std::unique_lock<std::mutex> pending_lock(pending_mutex);
            pending_signal.wait_for(pending_lock, wake_interval,
                                    [this] { return !pending_lines.empty() || !accepting.load(); });
            ready_lines.swap(pending_lines);
            keep_writing = accepting.load();
        }
        // append() refuses lines once accepting is false, so the last swap took everything
        write_lines(ready_lines, run_log_stream);
    }
}

std::shared_ptr<AsyncLogger> start_run_logger(const Config::SystemConfig& config) {
    LoggingContext* logging_context_ptr = get_logging_context();
    if (!logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized - call set_logging_context first");
    }

    std::error_code directory_error;
    std::filesystem::create_directories(RUN_LOG_DIRECTORY, directory_error);
    if (directory_error) {
        throw std::runtime_error("Failed to create log directory " + std::string(RUN_LOG_DIRECTORY) + ": " +
                                 directory_error.message());
    }

    std::string run_log_path = build_run_log_path(config.logging.log_file, TimeUtils::get_current_log_filename_stamp());
    auto logger_instance = std::make_shared<AsyncLogger>(run_log_path, config.logging.console_output,
                                                         config.logging.logging_poll_interval_milliseconds);
    logger_instance->start();

    logging_context_ptr->mode_tag = config.flags.dry_run ? DRY_RUN_MODE_TAG : LIVE_MODE_TAG;
    logging_context_ptr->async_logger = logger_instance;
    return logger_instance;
}

void stop_run_logger(AsyncLogger& logger) {
    logger.stop();
}

} // namespace Logging
} // namespace ReinvestTrader
