#pragma once

#include "strategy/ISignalDetector.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// EMA 골든/데드 크로스 + EMA99 추세 필터 + 캔들 방향 확인
class EmaCrossDetector : public ISignalDetector {
public:
    static constexpr int TREND_PERIOD = 99;

    explicit EmaCrossDetector(const EmaCrossParams& params);

    std::string getName() const override { return "ema_cross"; }
    size_t minimumHistory() const override;
    std::vector<Signal> detect(const std::vector<Candle>& candles) const override;

private:
    EmaCrossParams params_;
};

} // namespace strategy
} // namespace signalbench
