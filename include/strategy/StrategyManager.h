#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "common/Logger.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quantsim {
namespace strategy {

// Registry of strategies keyed by their config name (ma_cross, macd_cross, rsi_threshold).
class StrategyManager {
public:
    explicit StrategyManager(LoggerHandle logger = nullptr);

    // Lower-case, trimmed, with short aliases mapped ("ma" -> "ma_cross")
    static std::string normalizeStrategyName(std::string name);

    // Throws ValidationError for an unknown key or invalid parameters
    static std::shared_ptr<IStrategy> createStrategy(const std::string& key,
                                                     const StrategyConfigs& configs = StrategyConfigs());

    static std::vector<std::string> availableStrategies();

    void registerStrategy(const std::string& key, std::shared_ptr<IStrategy> strategy);
    // Creates and registers every key in `keys`
    void registerFromConfig(const std::vector<std::string>& keys, const StrategyConfigs& configs);

    std::shared_ptr<IStrategy> getStrategy(const std::string& key) const;
    std::vector<std::string> getStrategyNames() const;
    std::vector<std::shared_ptr<IStrategy>> getStrategies() const;
    size_t size() const { return strategies_.size(); }

private:
    LoggerHandle logger_;
    std::map<std::string, std::shared_ptr<IStrategy>> strategies_;
};

} // namespace strategy
} // namespace quantsim
