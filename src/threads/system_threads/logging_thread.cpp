/**
 * Logging thread.
 * Drains the asynchronous logger queue to console and the run's log file.
 */
#include "logging_thread.hpp"
#include <fstream>
#include <iostream>
#include <vector>

using namespace FvgScanner::Threads;
using namespace FvgScanner::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    try {
        setup_logging_thread();
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        std::lock_guard<std::mutex> console_guard(g_console_mtx);
        std::cerr << "Logging thread exception: " << exception.what() << std::endl;
    }
}

void LoggingThread::setup_logging_thread() {
    set_log_thread_tag("LOGGER");
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::lock_guard<std::mutex> console_guard(g_console_mtx);
        std::cerr << "WARNING: cannot open log file " << logger_ptr->get_file_path() << ", logging to console only" << std::endl;
    }

    std::vector<std::string> message_buffer;
    bool keep_running = true;
    while (keep_running) {
        keep_running = logger_ptr->wait_for_messages(message_buffer, config.logging.logging_poll_interval_milliseconds);
        if (!message_buffer.empty()) {
            logger_ptr->flush_message_buffer(message_buffer, log_file);
            logger_iterations->fetch_add(1);
        }
    }

    // Lines enqueued between the last wait and stop()
    logger_ptr->wait_for_messages(message_buffer, 0);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
