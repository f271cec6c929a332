#include "strategy/MacdCrossDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace signalbench {
namespace strategy {

MacdCrossDetector::MacdCrossDetector(const MacdCrossParams& params)
    : params_(params)
{
}

size_t MacdCrossDetector::minimumHistory() const {
    return static_cast<size_t>(analytics::TechnicalIndicators::MACD_SLOW);
}

std::vector<Signal> MacdCrossDetector::detect(const std::vector<Candle>& candles) const {
    std::vector<Signal> signals;
    if (candles.size() < minimumHistory()) return signals;

    const auto macd_data = analytics::TechnicalIndicators::calculateMACD(candles);
    const size_t len = std::min(macd_data.size(), candles.size());

    for (size_t i = 1; i < len; ++i) {
        const auto& prev = macd_data[i - 1];
        const auto& curr = macd_data[i];
        const auto& candle = candles[i];
        const double strength = std::abs(curr.macd - curr.signal);
        if (strength <= params_.min_strength) continue;

        if (prev.macd <= prev.signal && curr.macd > curr.signal && curr.histogram > 0) {
            Signal signal(candle.timestamp, SignalType::BUY, candle.close,
                          "MACD crossed above signal line with positive momentum");
            signal.strength = strength;
            signals.push_back(signal);
        }

        if (prev.macd >= prev.signal && curr.macd < curr.signal && curr.histogram < 0) {
            Signal signal(candle.timestamp, SignalType::SELL, candle.close,
                          "MACD crossed below signal line with negative momentum");
            signal.strength = strength;
            signals.push_back(signal);
        }
    }

    LOG_DEBUG("MACD cross: {} signals over {} candles", signals.size(), candles.size());
    return signals;
}

} // namespace strategy
} // namespace signalbench
