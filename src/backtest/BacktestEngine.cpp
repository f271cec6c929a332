#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include <algorithm>

namespace signalbench {
namespace backtest {

bool BacktestEngine::makeTrade(const Signal& entry, const Signal& exit, double capital, Trade& trade) {
    if (entry.type != SignalType::BUY || exit.type != SignalType::SELL) {
        return false;
    }
    if (entry.price <= 0.0) {
        LOG_WARN("Skipping trade at {} with non-positive entry price {}", entry.time, entry.price);
        return false;
    }

    trade.entry_price = entry.price;
    trade.exit_price = exit.price;
    trade.entry_time = entry.time;
    trade.exit_time = exit.time;
    trade.quantity = capital / entry.price;
    trade.profit = trade.quantity * (exit.price - entry.price);
    trade.profit_percentage = (exit.price - entry.price) / entry.price * 100.0;
    trade.capital_after_trade = capital + trade.profit;
    trade.entry_reason = entry.reason;
    trade.exit_reason = exit.reason;
    return true;
}

PerformanceStats BacktestEngine::calculateTradingStats(
    const std::vector<Signal>& signals,
    double initial_capital
) {
    PerformanceStats stats;
    stats.initial_capital = initial_capital;
    stats.final_capital = initial_capital;
    stats.hold_final_capital = initial_capital;

    if (signals.empty()) {
        return stats;
    }

    double current_capital = initial_capital;
    double peak_capital = initial_capital;
    double max_drawdown = 0.0;
    int winning_trades = 0;

    for (size_t i = 0; i + 1 < signals.size(); i += 2) {
        Trade trade;
        if (!makeTrade(signals[i], signals[i + 1], current_capital, trade)) {
            continue;
        }

        current_capital = trade.capital_after_trade;

        if (current_capital > peak_capital) {
            peak_capital = current_capital;
        } else if (peak_capital > 0.0) {
            const double drawdown = (peak_capital - current_capital) / peak_capital * 100.0;
            max_drawdown = std::max(max_drawdown, drawdown);
        }

        if (trade.profit > 0) winning_trades++;

        Logger::getInstance().logTrade(trade);
        stats.trades.push_back(std::move(trade));
    }

    stats.final_capital = current_capital;
    stats.total_profit = current_capital - initial_capital;
    stats.profit_percentage = (initial_capital > 0.0)
        ? (current_capital - initial_capital) / initial_capital * 100.0
        : 0.0;
    stats.total_trades = static_cast<int>(stats.trades.size());
    stats.winning_trades = winning_trades;
    stats.win_rate = stats.total_trades > 0
        ? static_cast<double>(winning_trades) / stats.total_trades * 100.0
        : 0.0;
    stats.max_drawdown = max_drawdown;

    // Buy & Hold (첫/마지막 신호 가격 기준)
    const double first_price = signals.front().price;
    const double last_price = signals.back().price;
    if (first_price > 0.0) {
        stats.hold_profit_percentage = (last_price - first_price) / first_price * 100.0;
    }
    stats.hold_final_capital = initial_capital * (1.0 + stats.hold_profit_percentage / 100.0);

    LOG_DEBUG("Backtest: {} trades, final capital {:.2f}, max drawdown {:.2f}%",
              stats.total_trades, stats.final_capital, stats.max_drawdown);
    return stats;
}

StrategyComparison BacktestEngine::compareWithHold(
    const std::vector<Candle>& candles,
    const std::vector<Signal>& signals,
    double initial_capital
) {
    StrategyComparison comparison;
    comparison.stats = calculateTradingStats({}, initial_capital);

    if (candles.empty() || signals.empty()) {
        return comparison;
    }

    comparison.stats = calculateTradingStats(signals, initial_capital);
    const auto& stats = comparison.stats;

    double gain_sum = 0.0;
    for (const auto& trade : stats.trades) {
        if (trade.profit <= 0) comparison.losing_trades++;
        gain_sum += trade.profit_percentage;
    }
    comparison.average_gain = stats.trades.empty() ? 0.0 : gain_sum / stats.trades.size();

    // 비교 기준은 구간 첫/마지막 종가 (신호 가격 기준 hold_* 와 별개)
    const double first_close = candles.front().close;
    const double last_close = candles.back().close;
    if (first_close > 0.0) {
        comparison.market_hold_percentage = (last_close - first_close) / first_close * 100.0;
    }
    comparison.hold_profit = comparison.market_hold_percentage / 100.0 * initial_capital;

    comparison.outperforms_hold = stats.total_profit > comparison.hold_profit;
    return comparison;
}

} // namespace backtest
} // namespace signalbench
