#include "strategy/StrategyConfig.h"
#include "common/Overloaded.h"

namespace signalbench {
namespace strategy {

namespace {
constexpr long long kSecondsPerDay = 24LL * 60 * 60;
}

std::string strategyTypeName(const StrategyParams& params) {
    return std::visit(utils::Overloaded{
        [](const EmaCrossParams&) { return std::string("ema_cross"); },
        [](const RsiDivergenceParams&) { return std::string("rsi_oversold"); },
        [](const MacdCrossParams&) { return std::string("macd_cross"); },
        [](const MultiParams&) { return std::string("multi"); }
    }, params);
}

std::optional<Timeframe> parseTimeframe(const std::string& name) {
    if (name == "all") return Timeframe::ALL;
    if (name == "1m") return Timeframe::ONE_MONTH;
    if (name == "3m") return Timeframe::THREE_MONTHS;
    if (name == "6m") return Timeframe::SIX_MONTHS;
    return std::nullopt;
}

std::string timeframeToString(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::ONE_MONTH: return "1m";
        case Timeframe::THREE_MONTHS: return "3m";
        case Timeframe::SIX_MONTHS: return "6m";
        case Timeframe::ALL:
        default: return "all";
    }
}

long long timeframeSeconds(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::ONE_MONTH: return 30 * kSecondsPerDay;
        case Timeframe::THREE_MONTHS: return 90 * kSecondsPerDay;
        case Timeframe::SIX_MONTHS: return 180 * kSecondsPerDay;
        case Timeframe::ALL:
        default: return 0;
    }
}

bool isSupportedEmaPeriod(int period) {
    return period == 7 || period == 25 || period == 99;
}

bool isSupportedRsiPeriod(int period) {
    return period == 14 || period == 21;
}

} // namespace strategy
} // namespace signalbench
