#include "strategy/EmaCrossDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace signalbench {
namespace strategy {

EmaCrossDetector::EmaCrossDetector(const EmaCrossParams& params)
    : params_(params)
{
}

size_t EmaCrossDetector::minimumHistory() const {
    return static_cast<size_t>(std::max({params_.fast_period, params_.slow_period, TREND_PERIOD}));
}

std::vector<Signal> EmaCrossDetector::detect(const std::vector<Candle>& candles) const {
    std::vector<Signal> signals;
    if (params_.fast_period <= 0 || params_.slow_period <= 0) return signals;
    if (candles.size() < minimumHistory()) return signals;

    using analytics::TechnicalIndicators;
    const auto fast_ema = TechnicalIndicators::calculateEMA(candles, params_.fast_period);
    const auto slow_ema = TechnicalIndicators::calculateEMA(candles, params_.slow_period);
    const auto trend_ema = TechnicalIndicators::calculateEMA(candles, TREND_PERIOD);

    const size_t len = std::min({candles.size(), fast_ema.size(), slow_ema.size(), trend_ema.size()});

    for (size_t i = 1; i < len; ++i) {
        const auto& candle = candles[i];
        const bool trend_up = candle.close > trend_ema[i].value;

        const double prev_fast = fast_ema[i - 1].value;
        const double prev_slow = slow_ema[i - 1].value;
        const double curr_fast = fast_ema[i].value;
        const double curr_slow = slow_ema[i].value;

        const bool crossed_up = prev_fast <= prev_slow && curr_fast > curr_slow;
        const bool crossed_down = prev_fast >= prev_slow && curr_fast < curr_slow;

        // 양봉/음봉 확인
        if (crossed_up && trend_up && candle.close > candle.open) {
            signals.emplace_back(candle.timestamp, SignalType::BUY, candle.close,
                "EMA " + std::to_string(params_.fast_period) + " crossed above EMA " +
                std::to_string(params_.slow_period) + " with trend confirmation");
        } else if (crossed_down && !trend_up && candle.close < candle.open) {
            signals.emplace_back(candle.timestamp, SignalType::SELL, candle.close,
                "EMA " + std::to_string(params_.fast_period) + " crossed below EMA " +
                std::to_string(params_.slow_period) + " with trend confirmation");
        }
    }

    LOG_DEBUG("EMA cross {}/{}: {} signals over {} candles",
              params_.fast_period, params_.slow_period, signals.size(), candles.size());
    return signals;
}

} // namespace strategy
} // namespace signalbench
