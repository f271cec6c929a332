#pragma once

#include "strategy/ISignalDetector.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// RSI 다이버전스
// buy: 과매도 구간에서 가격은 저점 하락, RSI는 저점 상승
// sell: 과매수 구간에서 가격은 고점 상승, RSI는 고점 하락
class RsiDivergenceDetector : public ISignalDetector {
public:
    static constexpr int TREND_SMA_PERIOD = 20;

    explicit RsiDivergenceDetector(const RsiDivergenceParams& params);

    std::string getName() const override { return "rsi_oversold"; }
    size_t minimumHistory() const override;
    std::vector<Signal> detect(const std::vector<Candle>& candles) const override;

private:
    RsiDivergenceParams params_;
};

} // namespace strategy
} // namespace signalbench
