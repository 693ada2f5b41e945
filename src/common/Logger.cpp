#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace quantsim {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

LoggerHandle Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return main_logger_;

    const std::filesystem::path logs_path = utils::PathUtils::resolvePath(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "quantsim.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
    return main_logger_;
}

LoggerHandle Logger::defaultHandle() {
    static LoggerHandle fallback = [] {
        auto existing = spdlog::get("quantsim");
        if (existing) {
            return existing;
        }
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        auto logger = std::make_shared<spdlog::logger>("quantsim", sink);
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    return fallback;
}

void Logger::logTrade(const LoggerHandle& trade_logger,
                      const std::string& date, const std::string& symbol, const std::string& side,
                      double price, long long quantity, double fees, double cash_after) {
    if (trade_logger) {
        std::ostringstream oss;
        oss << date << "," << symbol << "," << side << ","
            << std::fixed << std::setprecision(4) << price << ","
            << quantity << ","
            << std::fixed << std::setprecision(2) << fees << ","
            << std::fixed << std::setprecision(2) << cash_after;
        trade_logger->info(oss.str());
    }
}

} // namespace quantsim
