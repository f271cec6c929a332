#include "strategy/SignalGenerator.h"
#include "strategy/EmaCrossDetector.h"
#include "strategy/RsiDivergenceDetector.h"
#include "strategy/MacdCrossDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/CandleSeries.h"
#include "common/Logger.h"
#include "common/Overloaded.h"
#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace signalbench {
namespace strategy {

std::vector<std::unique_ptr<ISignalDetector>> SignalGenerator::createDetectors(const StrategyParams& params) {
    std::vector<std::unique_ptr<ISignalDetector>> detectors;

    std::visit(utils::Overloaded{
        [&](const EmaCrossParams& p) {
            detectors.push_back(std::make_unique<EmaCrossDetector>(p));
        },
        [&](const RsiDivergenceParams& p) {
            detectors.push_back(std::make_unique<RsiDivergenceDetector>(p));
        },
        [&](const MacdCrossParams& p) {
            detectors.push_back(std::make_unique<MacdCrossDetector>(p));
        },
        [&](const MultiParams& p) {
            if (p.ema_cross) {
                detectors.push_back(std::make_unique<EmaCrossDetector>(*p.ema_cross));
            }
            if (p.rsi_divergence) {
                detectors.push_back(std::make_unique<RsiDivergenceDetector>(*p.rsi_divergence));
            }
            if (p.macd_cross) {
                detectors.push_back(std::make_unique<MacdCrossDetector>(*p.macd_cross));
            }
        }
    }, params);

    return detectors;
}

std::vector<Candle> SignalGenerator::filterByTimeframe(
    const std::vector<Candle>& candles,
    const TimeframeWindow& window
) {
    if (window.timeframe == Timeframe::ALL || candles.empty()) {
        return candles;
    }

    const long long limit = timeframeSeconds(window.timeframe);
    const Timestamp reference = window.reference_time.value_or(candles.back().timestamp);

    std::vector<Candle> filtered;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(filtered),
                 [&](const Candle& candle) { return reference - candle.timestamp < limit; });
    return filtered;
}

std::vector<Signal> SignalGenerator::filterByVolume(
    const std::vector<Signal>& signals,
    const std::vector<Candle>& candles,
    double threshold
) {
    if (signals.empty() || candles.empty()) return {};
    if (threshold <= 0.0) threshold = DEFAULT_VOLUME_THRESHOLD;

    const double avg_volume = analytics::TechnicalIndicators::calculateMeanVolume(candles);

    std::unordered_map<Timestamp, double> volume_by_time;
    volume_by_time.reserve(candles.size());
    for (const auto& candle : candles) {
        volume_by_time.emplace(candle.timestamp, candle.volume);
    }

    std::vector<Signal> filtered;
    for (const auto& signal : signals) {
        auto it = volume_by_time.find(signal.time);
        if (it != volume_by_time.end() && it->second > avg_volume * threshold) {
            filtered.push_back(signal);
        }
    }
    return filtered;
}

std::vector<Signal> SignalGenerator::validateAlternation(std::vector<Signal> signals) {
    // 같은 시각이면 detector 평가 순서 유지
    std::stable_sort(signals.begin(), signals.end(),
                     [](const Signal& a, const Signal& b) { return a.time < b.time; });

    std::vector<Signal> validated;
    validated.reserve(signals.size());
    for (auto& signal : signals) {
        if (validated.empty()) {
            if (signal.type == SignalType::BUY) {
                validated.push_back(std::move(signal));
            }
            continue;
        }
        if (signal.type != validated.back().type) {
            validated.push_back(std::move(signal));
        }
    }
    return validated;
}

std::vector<Signal> SignalGenerator::generateSignals(
    const std::vector<Candle>& candles,
    const StrategyConfig& config
) {
    if (candles.size() < 2) return {};

    const auto series = analytics::CandleSeries::normalize(candles);
    const auto filtered = filterByTimeframe(series, config.window);
    if (filtered.size() < 2) {
        LOG_DEBUG("Timeframe {} left {} candles, no signals",
                  timeframeToString(config.window.timeframe), filtered.size());
        return {};
    }

    std::vector<Signal> signals;
    for (const auto& detector : createDetectors(config.params)) {
        auto detected = detector->detect(filtered);
        signals.insert(signals.end(),
                       std::make_move_iterator(detected.begin()),
                       std::make_move_iterator(detected.end()));
    }

    if (config.volume.enabled && !signals.empty()) {
        const size_t before = signals.size();
        signals = filterByVolume(signals, filtered, config.volume.threshold);
        LOG_DEBUG("Volume filter x{}: {} -> {} signals", config.volume.threshold, before, signals.size());
    }

    auto validated = validateAlternation(std::move(signals));
    LOG_DEBUG("Strategy {}: {} validated signals over {} candles",
              strategyTypeName(config.params), validated.size(), filtered.size());
    return validated;
}

} // namespace strategy
} // namespace signalbench
