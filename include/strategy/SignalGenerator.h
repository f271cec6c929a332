#pragma once

#include "strategy/ISignalDetector.h"
#include "strategy/StrategyConfig.h"
#include <memory>
#include <vector>

namespace signalbench {
namespace strategy {

// 설정에 따라 detector를 실행하고 신호 스트림을 정리한다.
// 순서: 시계열 정리 -> timeframe 필터 -> detector 합집합 -> 거래량 필터 -> 교대 검증
// 매 호출이 독립적이며 내부 상태를 남기지 않음.
class SignalGenerator {
public:
    static constexpr double DEFAULT_VOLUME_THRESHOLD = 1.5;

    // 고정 평가 순서: ema_cross, rsi_oversold, macd_cross
    static std::vector<std::unique_ptr<ISignalDetector>> createDetectors(const StrategyParams& params);

    static std::vector<Signal> generateSignals(
        const std::vector<Candle>& candles,
        const StrategyConfig& config
    );

    static std::vector<Candle> filterByTimeframe(
        const std::vector<Candle>& candles,
        const TimeframeWindow& window
    );

    // 거래량이 평균 * threshold 를 초과하는 캔들의 신호만 남김
    static std::vector<Signal> filterByVolume(
        const std::vector<Signal>& signals,
        const std::vector<Candle>& candles,
        double threshold
    );

    // 시간순 정렬 후 buy로 시작하는 buy/sell 교대 스트림만 남김
    static std::vector<Signal> validateAlternation(std::vector<Signal> signals);
};

} // namespace strategy
} // namespace signalbench
