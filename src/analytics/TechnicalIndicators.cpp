#include "analytics/TechnicalIndicators.h"
#include <numeric>

namespace signalbench {
namespace analytics {

// 값 배열에 대한 EMA (index 0 시드)
std::vector<double> TechnicalIndicators::emaOfValues(const std::vector<double>& values, int period) {
    std::vector<double> ema_values;
    if (values.empty() || period <= 0) return ema_values;

    const double k = 2.0 / (period + 1.0);
    double ema = values.front();

    ema_values.reserve(values.size());
    ema_values.push_back(ema);
    for (size_t i = 1; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
        ema_values.push_back(ema);
    }

    return ema_values;
}

// EMA 계산
std::vector<IndicatorPoint> TechnicalIndicators::calculateEMA(
    const std::vector<Candle>& candles,
    int period
) {
    std::vector<IndicatorPoint> result;
    const auto ema_values = emaOfValues(extractClosePrices(candles), period);

    result.reserve(ema_values.size());
    for (size_t i = 0; i < ema_values.size(); ++i) {
        result.emplace_back(candles[i].timestamp, ema_values[i]);
    }
    return result;
}

// SMA 계산 (누적합 슬라이딩 윈도우)
std::vector<IndicatorPoint> TechnicalIndicators::calculateSMA(
    const std::vector<Candle>& candles,
    int period
) {
    std::vector<IndicatorPoint> result;
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) return result;

    result.reserve(candles.size() - period + 1);
    double sum = 0.0;
    for (size_t i = 0; i < candles.size(); ++i) {
        sum += candles[i].close;
        if (i >= static_cast<size_t>(period)) {
            sum -= candles[i - period].close;
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            result.emplace_back(candles[i].timestamp, sum / period);
        }
    }
    return result;
}

// RSI 계산 (Wilder's Smoothing 방식)
std::vector<IndicatorPoint> TechnicalIndicators::calculateRSI(
    const std::vector<Candle>& candles,
    int period
) {
    std::vector<IndicatorPoint> result;
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return result;
    }

    auto toRsi = [](double avg_gain, double avg_loss) {
        if (avg_loss <= 0.0) return 100.0;
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    // 1. 초기 평균 (첫 period 기간의 단순 평균)
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = candles[i].close - candles[i - 1].close;
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }
    avg_gain /= period;
    avg_loss /= period;

    result.reserve(candles.size() - period);
    result.emplace_back(candles[period].timestamp, toRsi(avg_gain, avg_loss));

    // 2. Wilder's Smoothing 적용 (끝까지 순회)
    for (size_t i = period + 1; i < candles.size(); ++i) {
        const double change = candles[i].close - candles[i - 1].close;
        const double current_gain = (change > 0) ? change : 0.0;
        const double current_loss = (change < 0) ? -change : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;

        result.emplace_back(candles[i].timestamp, toRsi(avg_gain, avg_loss));
    }

    return result;
}

// MACD 계산
std::vector<MACDPoint> TechnicalIndicators::calculateMACD(const std::vector<Candle>& candles) {
    std::vector<MACDPoint> result;
    if (candles.size() < static_cast<size_t>(MACD_SLOW)) {
        return result;
    }

    const auto prices = extractClosePrices(candles);
    const auto fast_ema = emaOfValues(prices, MACD_FAST);
    const auto slow_ema = emaOfValues(prices, MACD_SLOW);

    // 두 EMA 모두 index 0 시드라 길이가 같음
    std::vector<double> macd_line(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        macd_line[i] = fast_ema[i] - slow_ema[i];
    }

    // Signal Line = MACD 선의 EMA(9), macd_line[0] 시드
    const auto signal_line = emaOfValues(macd_line, MACD_SIGNAL);

    result.reserve(macd_line.size());
    for (size_t i = 0; i < macd_line.size(); ++i) {
        MACDPoint point;
        point.time = candles[i].timestamp;
        point.macd = macd_line[i];
        point.signal = signal_line[i];
        point.histogram = macd_line[i] - signal_line[i];
        result.push_back(point);
    }

    return result;
}

double TechnicalIndicators::calculateMeanVolume(const std::vector<Candle>& candles) {
    if (candles.empty()) return 0.0;

    const double total = std::accumulate(candles.begin(), candles.end(), 0.0,
        [](double sum, const Candle& candle) { return sum + candle.volume; });
    return total / static_cast<double>(candles.size());
}

// Close 가격만 추출
std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

} // namespace analytics
} // namespace signalbench
