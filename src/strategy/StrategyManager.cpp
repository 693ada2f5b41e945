#include "strategy/StrategyManager.h"
#include "strategy/MovingAverageCrossStrategy.h"
#include "strategy/MacdCrossStrategy.h"
#include "strategy/RsiThresholdStrategy.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace quantsim {
namespace strategy {

namespace {
constexpr const char* MA_CROSS = "ma_cross";
constexpr const char* MACD_CROSS = "macd_cross";
constexpr const char* RSI_THRESHOLD = "rsi_threshold";

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}
} // namespace

StrategyManager::StrategyManager(LoggerHandle logger)
    : logger_(Logger::orDefault(std::move(logger)))
{
}

std::string StrategyManager::normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    // 짧은 별칭 허용
    if (name == "ma" || name == "ma_strategy") {
        return MA_CROSS;
    }
    if (name == "macd" || name == "macd_strategy") {
        return MACD_CROSS;
    }
    if (name == "rsi" || name == "rsi_strategy") {
        return RSI_THRESHOLD;
    }
    return name;
}

std::shared_ptr<IStrategy> StrategyManager::createStrategy(const std::string& key,
                                                           const StrategyConfigs& configs) {
    const std::string name = normalizeStrategyName(key);
    if (name == MA_CROSS) {
        return std::make_shared<MovingAverageCrossStrategy>(configs.ma_cross);
    }
    if (name == MACD_CROSS) {
        return std::make_shared<MacdCrossStrategy>(configs.macd_cross);
    }
    if (name == RSI_THRESHOLD) {
        return std::make_shared<RsiThresholdStrategy>(configs.rsi_threshold);
    }
    throw ValidationError("unknown strategy: " + key);
}

std::vector<std::string> StrategyManager::availableStrategies() {
    return {MA_CROSS, MACD_CROSS, RSI_THRESHOLD};
}

void StrategyManager::registerStrategy(const std::string& key, std::shared_ptr<IStrategy> strategy) {
    if (!strategy) {
        throw ValidationError("cannot register a null strategy under " + key);
    }
    const std::string name = normalizeStrategyName(key);
    logger_->info("Strategy registered: {} ({})", name, strategy->getName());
    strategies_[name] = std::move(strategy);
}

void StrategyManager::registerFromConfig(const std::vector<std::string>& keys, const StrategyConfigs& configs) {
    for (const auto& key : keys) {
        registerStrategy(key, createStrategy(key, configs));
    }
}

std::shared_ptr<IStrategy> StrategyManager::getStrategy(const std::string& key) const {
    auto it = strategies_.find(normalizeStrategyName(key));
    if (it == strategies_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> StrategyManager::getStrategyNames() const {
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& [name, strategy] : strategies_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::shared_ptr<IStrategy>> StrategyManager::getStrategies() const {
    std::vector<std::shared_ptr<IStrategy>> out;
    out.reserve(strategies_.size());
    for (const auto& [name, strategy] : strategies_) {
        out.push_back(strategy);
    }
    return out;
}

} // namespace strategy
} // namespace quantsim
