#pragma once

#include <optional>
#include <string>
#include <variant>
#include "common/Types.h"

namespace signalbench {
namespace strategy {

struct EmaCrossParams {
    int fast_period = 7;      // 7 / 25 / 99
    int slow_period = 25;
};

struct RsiDivergenceParams {
    int period = 14;          // 14 / 21
    double overbought = 70.0;
    double oversold = 30.0;
};

// MACD 12/26/9 고정. |macd - signal| 이 min_strength 이하인 교차는 버림
struct MacdCrossParams {
    double min_strength = 0.0;
};

// "multi": 활성화된 detector들의 합집합
struct MultiParams {
    std::optional<EmaCrossParams> ema_cross;
    std::optional<RsiDivergenceParams> rsi_divergence;
    std::optional<MacdCrossParams> macd_cross;
};

using StrategyParams = std::variant<EmaCrossParams, RsiDivergenceParams, MacdCrossParams, MultiParams>;

enum class Timeframe { ALL, ONE_MONTH, THREE_MONTHS, SIX_MONTHS };

struct TimeframeWindow {
    Timeframe timeframe = Timeframe::ALL;
    // 기준 시각. 없으면 마지막 캔들 시각 사용
    std::optional<Timestamp> reference_time;
};

struct VolumeFilter {
    bool enabled = false;
    double threshold = 1.5;   // 평균 거래량 대비 배수
};

struct StrategyConfig {
    StrategyParams params = MultiParams{EmaCrossParams{}, RsiDivergenceParams{}, MacdCrossParams{}};
    TimeframeWindow window;
    VolumeFilter volume;
};

// 설정 파일 / CLI 문자열 변환
std::string strategyTypeName(const StrategyParams& params);
std::optional<Timeframe> parseTimeframe(const std::string& name);
std::string timeframeToString(Timeframe timeframe);
long long timeframeSeconds(Timeframe timeframe);

bool isSupportedEmaPeriod(int period);
bool isSupportedRsiPeriod(int period);

} // namespace strategy
} // namespace signalbench
