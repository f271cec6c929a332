#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/StrategyConfig.h"

namespace signalbench {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    // 이미 파싱된 JSON 적용 (잘못된 값은 경고 후 기본값 유지)
    void apply(const nlohmann::json& j);
    void reset();

    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }
    double getInitialCapital() const { return initial_capital_; }
    void setInitialCapital(double v);

    std::string getStrategyType() const { return strategy_type_; }
    bool setStrategyType(const std::string& type);
    bool setTimeframe(const std::string& timeframe);
    void setVolumeFilter(bool enabled, double threshold);

    strategy::EmaCrossParams getEmaCrossParams() const { return ema_params_; }
    strategy::RsiDivergenceParams getRsiParams() const { return rsi_params_; }

    // 현재 설정으로 완성된 전략 설정 구조체 반환
    strategy::StrategyConfig getStrategyConfig() const;

private:
    Config() = default;

    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
    double initial_capital_ = 10000.0;

    std::string strategy_type_ = "multi";
    strategy::EmaCrossParams ema_params_;
    strategy::RsiDivergenceParams rsi_params_;
    strategy::MacdCrossParams macd_params_;
    std::vector<std::string> enabled_detectors_{"ema_cross", "rsi_oversold", "macd_cross"};
    strategy::Timeframe timeframe_ = strategy::Timeframe::ALL;
    strategy::VolumeFilter volume_filter_;
};

} // namespace signalbench
