#include "common/Config.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <variant>

using namespace signalbench;

int main() {
    Config& config = Config::getInstance();
    config.reset();

    // Defaults: multi with all three detectors
    {
        auto sc = config.getStrategyConfig();
        assert(config.getInitialCapital() == 10000.0);
        const auto* multi = std::get_if<strategy::MultiParams>(&sc.params);
        assert(multi != nullptr);
        assert(multi->ema_cross && multi->rsi_divergence && multi->macd_cross);
        assert(sc.window.timeframe == strategy::Timeframe::ALL);
        assert(!sc.volume.enabled);
        assert(sc.volume.threshold == 1.5);
    }

    // Load from file
    {
        const auto path = std::filesystem::temp_directory_path() / "signalbench_test_config.json";
        {
            std::ofstream out(path);
            out << R"({
                "logging": {"log_dir": "/tmp/signalbench_logs", "log_level": "debug"},
                "backtest": {"initial_capital": 2500.0},
                "strategy": {
                    "type": "ema_cross", "fast_ema": 25, "slow_ema": 99,
                    "rsi_period": 21, "timeframe": "3m",
                    "use_volume": true, "volume_threshold": 2.0
                }
            })";
        }
        config.load(path.string());
        std::filesystem::remove(path);

        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "/tmp/signalbench_logs");
        assert(config.getInitialCapital() == 2500.0);
        assert(config.getStrategyType() == "ema_cross");

        auto sc = config.getStrategyConfig();
        const auto* ema = std::get_if<strategy::EmaCrossParams>(&sc.params);
        assert(ema != nullptr);
        assert(ema->fast_period == 25 && ema->slow_period == 99);
        assert(config.getRsiParams().period == 21);
        assert(sc.window.timeframe == strategy::Timeframe::THREE_MONTHS);
        assert(sc.volume.enabled && sc.volume.threshold == 2.0);
    }

    // Invalid values keep previous settings
    {
        config.reset();
        config.apply(nlohmann::json::parse(R"({
            "backtest": {"initial_capital": -5},
            "strategy": {
                "type": "bollinger", "fast_ema": 10, "rsi_period": 9,
                "timeframe": "2y", "volume_threshold": 0,
                "macd_min_strength": -1,
                "enabled": ["macd_cross", "unknown", "rsi"]
            }
        })"));
        assert(config.getInitialCapital() == 10000.0);
        assert(config.getStrategyType() == "multi");
        assert(config.getEmaCrossParams().fast_period == 7);
        assert(config.getRsiParams().period == 14);

        auto sc = config.getStrategyConfig();
        assert(sc.window.timeframe == strategy::Timeframe::ALL);
        assert(sc.volume.threshold == 1.5);
        const auto* multi = std::get_if<strategy::MultiParams>(&sc.params);
        assert(multi != nullptr);
        assert(!multi->ema_cross);
        assert(multi->rsi_divergence && multi->macd_cross);
        assert(multi->macd_cross->min_strength == 0.0);
    }

    // MACD strength floor reaches the detector params
    {
        config.reset();
        config.apply(nlohmann::json::parse(R"({"strategy": {"type": "macd_cross", "macd_min_strength": 0.05}})"));
        auto sc = config.getStrategyConfig();
        const auto* macd = std::get_if<strategy::MacdCrossParams>(&sc.params);
        assert(macd != nullptr);
        assert(macd->min_strength == 0.05);
    }

    // CLI style overrides
    {
        config.reset();
        assert(config.setStrategyType("MACD_CROSS"));
        assert(!config.setStrategyType("grid"));
        assert(config.setTimeframe("1m"));
        auto sc = config.getStrategyConfig();
        assert(std::holds_alternative<strategy::MacdCrossParams>(sc.params));
        assert(strategy::strategyTypeName(sc.params) == "macd_cross");
        assert(sc.window.timeframe == strategy::Timeframe::ONE_MONTH);
    }

    // Missing file keeps defaults
    {
        config.reset();
        config.load("/nonexistent/signalbench/config.json");
        assert(config.getStrategyType() == "multi");
    }

    config.reset();
    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
