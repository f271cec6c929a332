#pragma once

#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace analytics {

// Technical Indicators - 캔들 시계열 전체에 대한 지표 시리즈
// 모든 함수는 순수 함수이며 O(n). 데이터 부족 시 빈 시리즈 반환.
class TechnicalIndicators {
public:
    static constexpr int MACD_FAST = 12;
    static constexpr int MACD_SLOW = 26;
    static constexpr int MACD_SIGNAL = 9;

    // EMA (Exponential Moving Average)
    // 첫 종가로 시드, 캔들마다 1개 포인트 (warm-up 구간 없음)
    static std::vector<IndicatorPoint> calculateEMA(const std::vector<Candle>& candles, int period);

    // SMA (Simple Moving Average) - 첫 포인트는 index period-1
    static std::vector<IndicatorPoint> calculateSMA(const std::vector<Candle>& candles, int period);

    // RSI (Wilder's Smoothing) - 첫 포인트는 index period
    // 70 이상: 과매수, 30 이하: 과매도. avg_loss == 0 이면 100.
    static std::vector<IndicatorPoint> calculateRSI(const std::vector<Candle>& candles, int period = 14);

    // MACD 12/26/9 (고정). 26개 미만이면 빈 결과.
    static std::vector<MACDPoint> calculateMACD(const std::vector<Candle>& candles);

    static double calculateMeanVolume(const std::vector<Candle>& candles);

    // Helper: 가격 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

private:
    static std::vector<double> emaOfValues(const std::vector<double>& values, int period);
};

} // namespace analytics
} // namespace signalbench
