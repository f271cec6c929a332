#include "backtest/ReportSerializer.h"

namespace signalbench {
namespace backtest {

nlohmann::json ReportSerializer::toJson(const Signal& signal) {
    nlohmann::json j;
    j["time"] = signal.time;
    j["type"] = signalTypeToString(signal.type);
    j["price"] = signal.price;
    j["reason"] = signal.reason;
    if (signal.strength) {
        j["strength"] = *signal.strength;
    }
    return j;
}

nlohmann::json ReportSerializer::toJson(const Trade& trade) {
    return {
        {"entry_price", trade.entry_price},
        {"exit_price", trade.exit_price},
        {"entry_time", trade.entry_time},
        {"exit_time", trade.exit_time},
        {"quantity", trade.quantity},
        {"profit", trade.profit},
        {"profit_percentage", trade.profit_percentage},
        {"capital_after_trade", trade.capital_after_trade},
        {"entry_reason", trade.entry_reason},
        {"exit_reason", trade.exit_reason}
    };
}

nlohmann::json ReportSerializer::toJson(const PerformanceStats& stats) {
    nlohmann::json j;
    j["initial_capital"] = stats.initial_capital;
    j["final_capital"] = stats.final_capital;
    j["total_profit"] = stats.total_profit;
    j["profit_percentage"] = stats.profit_percentage;
    j["win_rate"] = stats.win_rate;
    j["total_trades"] = stats.total_trades;
    j["winning_trades"] = stats.winning_trades;
    j["max_drawdown"] = stats.max_drawdown;
    j["hold_final_capital"] = stats.hold_final_capital;
    j["hold_profit_percentage"] = stats.hold_profit_percentage;

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : stats.trades) {
        j["trades"].push_back(toJson(trade));
    }
    return j;
}

nlohmann::json ReportSerializer::toJson(const StrategyComparison& comparison) {
    nlohmann::json j = toJson(comparison.stats);
    j["losing_trades"] = comparison.losing_trades;
    j["average_gain"] = comparison.average_gain;
    j["hold_profit"] = comparison.hold_profit;
    j["market_hold_percentage"] = comparison.market_hold_percentage;
    j["outperforms_hold"] = comparison.outperforms_hold;
    return j;
}

nlohmann::json ReportSerializer::signalsToJson(const std::vector<Signal>& signals) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& signal : signals) {
        arr.push_back(toJson(signal));
    }
    return arr;
}

nlohmann::json ReportSerializer::indicatorToJson(const std::vector<IndicatorPoint>& points) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& point : points) {
        arr.push_back({{"time", point.time}, {"value", point.value}});
    }
    return arr;
}

nlohmann::json ReportSerializer::macdToJson(const std::vector<MACDPoint>& points) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& point : points) {
        arr.push_back({
            {"time", point.time},
            {"macd", point.macd},
            {"signal", point.signal},
            {"histogram", point.histogram}
        });
    }
    return arr;
}

} // namespace backtest
} // namespace signalbench
