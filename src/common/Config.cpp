#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace signalbench {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    // Backward compatibility alias
    if (name == "rsi" || name == "rsi_divergence") {
        return "rsi_oversold";
    }
    return name;
}

bool isKnownDetector(const std::string& name) {
    return name == "ema_cross" || name == "rsi_oversold" || name == "macd_cross";
}

bool isKnownStrategy(const std::string& name) {
    return isKnownDetector(name) || name == "multi";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_dir_ = "logs";
    log_level_ = "info";
    initial_capital_ = 10000.0;
    strategy_type_ = "multi";
    ema_params_ = strategy::EmaCrossParams{};
    rsi_params_ = strategy::RsiDivergenceParams{};
    macd_params_ = strategy::MacdCrossParams{};
    enabled_detectors_ = {"ema_cross", "rsi_oversold", "macd_cross"};
    timeframe_ = strategy::Timeframe::ALL;
    volume_filter_ = strategy::VolumeFilter{};
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute() || std::filesystem::exists(path)) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << std::endl;
            std::cerr << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cerr << "Config loaded: strategy=" << strategy_type_
                  << ", capital=" << initial_capital_ << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_dir_ = l.value("log_dir", log_dir_);
        log_level_ = l.value("log_level", log_level_);
    }

    if (j.contains("backtest")) {
        setInitialCapital(j["backtest"].value("initial_capital", initial_capital_));
    }

    if (!j.contains("strategy")) {
        return;
    }
    const auto& s = j["strategy"];

    if (s.contains("type") && !setStrategyType(s["type"].get<std::string>())) {
        std::cerr << "Warning: unknown strategy type, keeping " << strategy_type_ << std::endl;
    }

    const int fast = s.value("fast_ema", ema_params_.fast_period);
    const int slow = s.value("slow_ema", ema_params_.slow_period);
    if (strategy::isSupportedEmaPeriod(fast) && strategy::isSupportedEmaPeriod(slow)) {
        ema_params_.fast_period = fast;
        ema_params_.slow_period = slow;
    } else {
        std::cerr << "Warning: EMA periods must be 7, 25 or 99. Ignored." << std::endl;
    }

    const int rsi_period = s.value("rsi_period", rsi_params_.period);
    if (strategy::isSupportedRsiPeriod(rsi_period)) {
        rsi_params_.period = rsi_period;
    } else {
        std::cerr << "Warning: RSI period must be 14 or 21. Ignored." << std::endl;
    }

    const double overbought = s.value("rsi_overbought", rsi_params_.overbought);
    const double oversold = s.value("rsi_oversold", rsi_params_.oversold);
    if (oversold > 0.0 && oversold < overbought && overbought < 100.0) {
        rsi_params_.overbought = overbought;
        rsi_params_.oversold = oversold;
    } else {
        std::cerr << "Warning: invalid RSI thresholds. Ignored." << std::endl;
    }

    const double min_strength = s.value("macd_min_strength", macd_params_.min_strength);
    if (min_strength >= 0.0) {
        macd_params_.min_strength = min_strength;
    } else {
        std::cerr << "Warning: MACD min strength must not be negative. Ignored." << std::endl;
    }

    if (s.contains("enabled")) {
        std::vector<std::string> enabled;
        for (auto name : s["enabled"].get<std::vector<std::string>>()) {
            name = normalizeStrategyName(name);
            if (!isKnownDetector(name)) {
                std::cerr << "Warning: unknown detector '" << name << "' ignored." << std::endl;
                continue;
            }
            if (std::find(enabled.begin(), enabled.end(), name) == enabled.end()) {
                enabled.push_back(name);
            }
        }
        enabled_detectors_ = enabled;
    }

    if (s.contains("timeframe") && !setTimeframe(s["timeframe"].get<std::string>())) {
        std::cerr << "Warning: unknown timeframe, keeping "
                  << strategy::timeframeToString(timeframe_) << std::endl;
    }

    setVolumeFilter(s.value("use_volume", volume_filter_.enabled),
                    s.value("volume_threshold", volume_filter_.threshold));
}

void Config::setInitialCapital(double v) {
    if (v > 0.0) {
        initial_capital_ = v;
    } else {
        std::cerr << "Warning: initial capital must be positive. Ignored." << std::endl;
    }
}

bool Config::setStrategyType(const std::string& type) {
    const std::string name = normalizeStrategyName(type);
    if (!isKnownStrategy(name)) {
        return false;
    }
    strategy_type_ = name;
    return true;
}

bool Config::setTimeframe(const std::string& timeframe) {
    const auto parsed = strategy::parseTimeframe(trimCopy(timeframe));
    if (!parsed) {
        return false;
    }
    timeframe_ = *parsed;
    return true;
}

void Config::setVolumeFilter(bool enabled, double threshold) {
    volume_filter_.enabled = enabled;
    if (threshold > 0.0) {
        volume_filter_.threshold = threshold;
    } else {
        std::cerr << "Warning: volume threshold must be positive. Ignored." << std::endl;
    }
}

strategy::StrategyConfig Config::getStrategyConfig() const {
    strategy::StrategyConfig config;
    config.window.timeframe = timeframe_;
    config.volume = volume_filter_;

    if (strategy_type_ == "ema_cross") {
        config.params = ema_params_;
    } else if (strategy_type_ == "rsi_oversold") {
        config.params = rsi_params_;
    } else if (strategy_type_ == "macd_cross") {
        config.params = macd_params_;
    } else {
        strategy::MultiParams multi;
        auto enabled = [&](const char* name) {
            return std::find(enabled_detectors_.begin(), enabled_detectors_.end(), name)
                   != enabled_detectors_.end();
        };
        if (enabled("ema_cross")) multi.ema_cross = ema_params_;
        if (enabled("rsi_oversold")) multi.rsi_divergence = rsi_params_;
        if (enabled("macd_cross")) multi.macd_cross = macd_params_;
        config.params = multi;
    }

    return config;
}

} // namespace signalbench
