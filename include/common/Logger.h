#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace quantsim {

using LoggerHandle = std::shared_ptr<spdlog::logger>;

class Logger {
public:
    static Logger& getInstance();

    // Console + rotating file sink under log_dir, plus the daily trade log.
    // The returned handle is owned by the caller (the runner) and passed to components.
    LoggerHandle initialize(const std::string& log_dir = "logs",
                            const std::string& level = "info");

    // Console-only handle for components constructed without one
    static LoggerHandle defaultHandle();

    // Resolve an optional handle to something usable
    static LoggerHandle orDefault(LoggerHandle handle) {
        return handle ? handle : defaultHandle();
    }

    LoggerHandle main() const { return main_logger_; }

    // Daily trade CSV logger, null until initialize()
    LoggerHandle tradeLogger() const { return trade_logger_; }

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

    // 체결 1건당 CSV 한 줄. A null handle writes nothing.
    static void logTrade(const LoggerHandle& trade_logger,
                         const std::string& date, const std::string& symbol, const std::string& side,
                         double price, long long quantity, double fees, double cash_after);

private:
    Logger() = default;
    LoggerHandle main_logger_;
    LoggerHandle trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) quantsim::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) quantsim::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) quantsim::Logger::getInstance().error(__VA_ARGS__)

} // namespace quantsim
