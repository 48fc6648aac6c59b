#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <string>
#include <atomic>
#include <fstream>
#include <memory>
#include <vector>
#include "logging/async_logger.hpp"
#include "configs/system_config.hpp"

namespace FvgScanner {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger,
                  std::atomic<unsigned long>& iterations,
                  const FvgScanner::Config::SystemConfig& system_config)
        : logger_ptr(logger), logger_iterations(&iterations), config(system_config) {}

    void operator()();

private:
    std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger_ptr;
    std::atomic<unsigned long>* logger_iterations;
    const FvgScanner::Config::SystemConfig& config;

    void setup_logging_thread();
    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace FvgScanner

#endif // LOGGING_THREAD_HPP
