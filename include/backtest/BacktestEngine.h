#pragma once

#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace backtest {

// 검증된 신호 스트림으로 복리 매매를 시뮬레이션
// FLAT -> (buy) LONG -> (sell) FLAT ... 짝이 없는 마지막 buy는 청산하지 않음
class BacktestEngine {
public:
    static constexpr double DEFAULT_INITIAL_CAPITAL = 10000.0;

    // 신호를 2개씩 (0/1, 2/3, ...) 묶어 buy/sell 쌍만 거래로 인정
    // buy-and-hold 기준은 첫/마지막 신호 가격
    static PerformanceStats calculateTradingStats(
        const std::vector<Signal>& signals,
        double initial_capital = DEFAULT_INITIAL_CAPITAL
    );

    // calculateTradingStats 결과 + buy-and-hold 대비 비교 지표
    static StrategyComparison compareWithHold(
        const std::vector<Candle>& candles,
        const std::vector<Signal>& signals,
        double initial_capital = DEFAULT_INITIAL_CAPITAL
    );

private:
    static bool makeTrade(const Signal& entry, const Signal& exit, double capital, Trade& trade);
};

} // namespace backtest
} // namespace signalbench
