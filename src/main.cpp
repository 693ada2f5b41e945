#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "strategy/StrategyManager.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace quantsim;

namespace {

struct CliOptions {
    std::string data_path;
    std::string symbol;
    std::map<std::string, std::string> extra_symbols;   // --add SYMBOL=path
    std::string config_path = "config/config.json";
    std::string strategy;
    std::string start_date;
    std::string end_date;
    std::string benchmark_path;
    std::string output_path;
    std::optional<double> initial_capital;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "Usage: quantsim_backtest <bars.csv|bars.json> [options]\n"
              << "  --symbol <code>            symbol of the primary series\n"
              << "  --add <code>=<path>        extra series (runs the common-date portfolio)\n"
              << "  --strategy <name>          ma_cross | macd_cross | rsi_threshold\n"
              << "  --config <path>            default config/config.json\n"
              << "  --initial-capital <value>\n"
              << "  --start <YYYY-MM-DD>  --end <YYYY-MM-DD>\n"
              << "  --benchmark <path>         benchmark bars for beta/alpha\n"
              << "  --output <path>            write the full result as JSON\n"
              << "  --json                     print the result JSON to stdout\n";
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

BarSeries loadBars(const std::string& path) {
    if (toLowerCopy(std::filesystem::path(path).extension().string()) == ".json") {
        return backtest::DataHistory::loadJSON(path);
    }
    return backtest::DataHistory::loadCSV(path);
}

BarSeries loadFiltered(const std::string& path, const CliOptions& options) {
    return backtest::DataHistory::filterByDate(loadBars(path), options.start_date, options.end_date);
}

// Returns nullopt after printing the problem when the arguments are unusable
std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return std::nullopt;
    }

    CliOptions options;
    options.data_path = argv[1];
    if (options.data_path == "--help" || options.data_path == "-h") {
        printUsage();
        return std::nullopt;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--symbol" && has_value) {
            options.symbol = argv[++i];
        } else if (arg == "--add" && has_value) {
            const std::string entry = argv[++i];
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
                std::cerr << "--add expects SYMBOL=path, got: " << entry << "\n";
                return std::nullopt;
            }
            options.extra_symbols[entry.substr(0, eq)] = entry.substr(eq + 1);
        } else if (arg == "--strategy" && has_value) {
            options.strategy = argv[++i];
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--start" && has_value) {
            options.start_date = argv[++i];
        } else if (arg == "--end" && has_value) {
            options.end_date = argv[++i];
        } else if (arg == "--benchmark" && has_value) {
            options.benchmark_path = argv[++i];
        } else if (arg == "--output" && has_value) {
            options.output_path = argv[++i];
        } else if (arg == "--initial-capital" && has_value) {
            const std::string text = argv[++i];
            try {
                options.initial_capital = std::stod(text);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value: " << text << "\n";
                return std::nullopt;
            }
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            printUsage();
            return std::nullopt;
        }
    }
    return options;
}

void printSummary(const backtest::BacktestResult& result) {
    const auto& p = result.performance;
    std::cout << "\n백테스트 결과 (" << result.strategy_name << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "기간:         " << p.start_date << " ~ " << p.end_date
              << " (" << p.trading_days << " days)\n";
    std::cout << "초기 자본:    " << result.initial_capital << "\n";
    std::cout << "최종 평가액:  " << result.final_value << "\n";
    std::cout << "총 수익률:    " << (p.total_return * 100.0) << "%\n";
    std::cout << "연환산 수익률: " << (p.annualized_return * 100.0) << "%\n";
    std::cout << "MDD:          " << (p.max_drawdown * 100.0) << "%\n";
    std::cout << std::setprecision(3);
    std::cout << "Sharpe:       " << p.sharpe_ratio << "\n";
    std::cout << "Sortino:      " << p.sortino_ratio << "\n";
    std::cout << "Calmar:       " << p.calmar_ratio << "\n";
    if (p.has_benchmark) {
        std::cout << "Beta/Alpha:   " << p.beta << " / " << p.alpha << "\n";
    }
    std::cout << "총 거래 수:   " << result.trades.size()
              << " (청산 " << p.trades.total_trades << ")\n";
    std::cout << std::setprecision(2);
    std::cout << "승률:         " << (p.trades.win_rate * 100.0) << "%\n";
    std::cout << std::setprecision(3);
    std::cout << "Profit Factor: " << p.trades.profit_factor << "\n";
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const auto parsed = parseArgs(argc, argv);
    if (!parsed) {
        return 2;
    }
    const CliOptions& options = *parsed;

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);
        if (options.initial_capital) {
            config.setInitialCapital(*options.initial_capital);
        }

        LoggerHandle logger = Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const std::string strategy_key = options.strategy.empty()
            ? config.getDefaultStrategy()
            : options.strategy;
        const auto strategy = strategy::StrategyManager::createStrategy(strategy_key, config.getStrategyConfigs());
        LOG_INFO("Starting backtest: data={}, strategy={}", options.data_path, strategy->getName());

        backtest::BacktestEngine engine(config.toBacktestConfig(), logger,
                                        Logger::getInstance().tradeLogger());
        if (!options.benchmark_path.empty()) {
            engine.setBenchmark(backtest::DataHistory::closeReturns(
                loadFiltered(options.benchmark_path, options)));
        }

        backtest::BacktestResult result;
        if (options.extra_symbols.empty()) {
            const BarSeries bars = loadFiltered(options.data_path, options);
            result = engine.run(*strategy, bars, options.symbol);
        } else {
            std::map<std::string, BarSeries> data;
            const std::string primary = options.symbol.empty()
                ? std::filesystem::path(options.data_path).stem().string()
                : options.symbol;
            data[primary] = loadFiltered(options.data_path, options);
            for (const auto& [symbol, path] : options.extra_symbols) {
                data[symbol] = loadFiltered(path, options);
            }
            result = engine.runMultiple(*strategy, data);
        }

        const nlohmann::json j = backtest::toJson(result);
        if (!options.output_path.empty()) {
            std::ofstream out(options.output_path);
            if (!out.is_open()) {
                LOG_ERROR("Cannot write result file: {}", options.output_path);
                return 1;
            }
            out << j.dump(2) << "\n";
            LOG_INFO("Result written to {}", options.output_path);
        }

        if (options.json_mode) {
            std::cout << j.dump() << "\n";
        } else {
            printSummary(result);
        }
        return 0;
    } catch (const QuantSimError& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
