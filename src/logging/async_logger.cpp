/**
 * Asynchronous logging for scan runs.
 * Worker threads enqueue formatted lines; the logging thread writes them to console and file.
 */
#include "logging/async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <ctime>
#include <cstdio>
#include <filesystem>

namespace FvgScanner {
namespace Logging {

static std::atomic<AsyncLogger*> g_async_logger{nullptr};
static thread_local std::string t_log_tag = "MAIN  ";
std::mutex g_console_mtx;

void set_async_logger(AsyncLogger* logger) {
    g_async_logger.store(logger);
}

void set_log_thread_tag(const std::string& tag6) {
    std::string t = tag6;
    if (t.size() < LOG_TAG_WIDTH) t.append(LOG_TAG_WIDTH - t.size(), ' ');
    if (t.size() > LOG_TAG_WIDTH) t = t.substr(0, LOG_TAG_WIDTH);
    t_log_tag = t;
}

void log_message(const std::string& message, const std::string& log_file_path) {
    std::stringstream ss;
    ss << TimeUtils::get_current_human_readable_time() << " [" << t_log_tag << "]   " << message << std::endl;
    std::string log_str = ss.str();

    AsyncLogger* logger = g_async_logger.load();
    if (logger && logger->running.load()) {
        logger->enqueue(log_str);
        return;
    }

    {
        std::lock_guard<std::mutex> cguard(g_console_mtx);
        std::cout << log_str;
    }

    // Only write to file if log_file_path is not empty
    if (!log_file_path.empty()) {
        std::ofstream log_file(log_file_path, std::ios::app);
        if (log_file.is_open()) {
            log_file << log_str;
        }
    }
}

std::string get_git_commit_hash() {
    FILE* pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!pipe) {
        return "unknown";
    }

    char buffer[128];
    std::string result = "";
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result += buffer;
    }
    pclose(pipe);

    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }

    return result.empty() ? "unknown" : result;
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    std::string git_hash = get_git_commit_hash();

    std::string base_name = base_filename;
    std::string extension = "";

    size_t dot_pos = base_filename.find_last_of('.');
    size_t slash_pos = base_filename.find_last_of('/');
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        base_name = base_filename.substr(0, dot_pos);
        extension = base_filename.substr(dot_pos);
    }

    // base_name_DD-HH-MM_githash.extension
    std::stringstream ss;
    ss << base_name << "_" << std::put_time(&local_tm, TimeUtils::LOG_FILENAME) << "_" << git_hash << extension;
    return ss.str();
}

void initialize_global_logger(AsyncLogger& logger) {
    // Lines queue up until the logging thread starts draining
    logger.running.store(true);
    set_async_logger(&logger);
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
    set_async_logger(nullptr);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

bool AsyncLogger::wait_for_messages(std::vector<std::string>& message_buffer, int poll_interval_milliseconds) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, std::chrono::milliseconds(poll_interval_milliseconds), [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
    return running.load();
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    {
        std::lock_guard<std::mutex> cguard(g_console_mtx);
        for (const auto& log_line : message_buffer) {
            std::cout << log_line;
        }
        std::cout << std::flush;
    }

    if (log_file.is_open()) {
        for (const auto& log_line : message_buffer) {
            log_file << log_line;
        }
        log_file.flush();
    }
    message_buffer.clear();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const FvgScanner::Config::SystemConfig& config) {
    std::string timestamped_log_file = generate_timestamped_log_filename(config.logging.log_file);

    std::filesystem::path log_file_path(timestamped_log_file);
    if (log_file_path.has_parent_path()) {
        std::filesystem::create_directories(log_file_path.parent_path());
    }

    auto logger = std::make_shared<AsyncLogger>(timestamped_log_file);
    initialize_global_logger(*logger);
    set_log_thread_tag("MAIN  ");

    return logger;
}

} // namespace Logging
} // namespace FvgScanner
