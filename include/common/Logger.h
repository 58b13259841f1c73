#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace stratlab {

// Process-wide logger. Calls are no-ops until initialize() runs, so library
// code and tests can log freely without any sink set up.
class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per executed trade:
    // symbol,strategy,date,type,price,quantity,pnl,reason
    void logTrade(const std::string& symbol, const std::string& strategy,
                  const std::string& date, const std::string& type,
                  double price, double quantity, double pnl,
                  const std::string& reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) stratlab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) stratlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stratlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stratlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace stratlab
