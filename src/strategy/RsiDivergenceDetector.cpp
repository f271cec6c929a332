#include "strategy/RsiDivergenceDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace signalbench {
namespace strategy {

RsiDivergenceDetector::RsiDivergenceDetector(const RsiDivergenceParams& params)
    : params_(params)
{
}

size_t RsiDivergenceDetector::minimumHistory() const {
    return static_cast<size_t>(std::max(params_.period, 0) + TREND_SMA_PERIOD);
}

std::vector<Signal> RsiDivergenceDetector::detect(const std::vector<Candle>& candles) const {
    std::vector<Signal> signals;
    if (params_.period <= 0) return signals;
    if (candles.size() < minimumHistory()) return signals;

    using analytics::TechnicalIndicators;
    const auto rsi_values = TechnicalIndicators::calculateRSI(candles, params_.period);
    const auto sma20 = TechnicalIndicators::calculateSMA(candles, TREND_SMA_PERIOD);

    // rsi_values[0] == candles[period], sma20[0] == candles[19]
    const size_t rsi_offset = static_cast<size_t>(params_.period);
    const size_t sma_offset = static_cast<size_t>(TREND_SMA_PERIOD - 1);
    const size_t start = std::max(rsi_offset + 1, sma_offset);

    for (size_t i = start; i < candles.size(); ++i) {
        if (i - rsi_offset >= rsi_values.size() || i - sma_offset >= sma20.size()) continue;

        const double rsi = rsi_values[i - rsi_offset].value;
        const double prev_rsi = rsi_values[i - 1 - rsi_offset].value;
        const auto& candle = candles[i];
        const auto& prev = candles[i - 1];

        // TODO: trend_up is computed but never gates emission; decide whether
        // divergence buys should require close > SMA20 before wiring it in.
        [[maybe_unused]] const bool trend_up = candle.close > sma20[i - sma_offset].value;

        if (rsi < params_.oversold && prev_rsi < params_.oversold &&
            candle.low < prev.low && rsi > prev_rsi) {
            signals.emplace_back(candle.timestamp, SignalType::BUY, candle.close, "RSI bullish divergence");
        }

        if (rsi > params_.overbought && prev_rsi > params_.overbought &&
            candle.high > prev.high && rsi < prev_rsi) {
            signals.emplace_back(candle.timestamp, SignalType::SELL, candle.close, "RSI bearish divergence");
        }
    }

    LOG_DEBUG("RSI divergence {}: {} signals over {} candles",
              params_.period, signals.size(), candles.size());
    return signals;
}

} // namespace strategy
} // namespace signalbench
