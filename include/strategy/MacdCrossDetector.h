#pragma once

#include "strategy/ISignalDetector.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// MACD / Signal 선 교차 + 히스토그램 부호 확인
class MacdCrossDetector : public ISignalDetector {
public:
    explicit MacdCrossDetector(const MacdCrossParams& params = MacdCrossParams{});

    std::string getName() const override { return "macd_cross"; }
    size_t minimumHistory() const override;
    std::vector<Signal> detect(const std::vector<Candle>& candles) const override;

private:
    MacdCrossParams params_;
};

} // namespace strategy
} // namespace signalbench
