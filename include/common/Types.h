#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace signalbench {

using Timestamp = long long;   // epoch seconds
using Price = double;
using Volume = double;
using Amount = double;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    Timestamp timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, Timestamp t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 지표 값 (차트용)
struct IndicatorPoint {
    Timestamp time;
    double value;

    IndicatorPoint() : time(0), value(0) {}
    IndicatorPoint(Timestamp t, double v) : time(t), value(v) {}
};

struct MACDPoint {
    Timestamp time;
    double macd;        // MACD 선
    double signal;      // Signal 선
    double histogram;   // MACD - Signal

    MACDPoint() : time(0), macd(0), signal(0), histogram(0) {}
};

enum class SignalType { BUY, SELL };

struct Signal {
    Timestamp time;
    SignalType type;
    Price price;
    std::string reason;
    std::optional<double> strength;

    Signal() : time(0), type(SignalType::BUY), price(0) {}
    Signal(Timestamp t, SignalType s, Price p, std::string r = "")
        : time(t), type(s), price(p), reason(std::move(r)) {}
};

// buy 1개 + 다음 sell 1개로 구성된 완결 거래
struct Trade {
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    Timestamp entry_time = 0;
    Timestamp exit_time = 0;
    double quantity = 0.0;
    Amount profit = 0.0;
    double profit_percentage = 0.0;
    Amount capital_after_trade = 0.0;
    std::string entry_reason;
    std::string exit_reason;
};

struct PerformanceStats {
    double initial_capital = 0.0;
    double final_capital = 0.0;
    double total_profit = 0.0;
    double profit_percentage = 0.0;
    double win_rate = 0.0;          // %
    int total_trades = 0;
    int winning_trades = 0;
    double max_drawdown = 0.0;      // %
    double hold_final_capital = 0.0;
    double hold_profit_percentage = 0.0;
    std::vector<Trade> trades;
};

// Strategy vs. passive buy-and-hold over the same run.
struct StrategyComparison {
    PerformanceStats stats;
    int losing_trades = 0;
    double average_gain = 0.0;            // mean per-trade profit %
    double hold_profit = 0.0;             // first/last candle close, scaled to capital
    double market_hold_percentage = 0.0;  // first/last candle close
    bool outperforms_hold = false;
};

inline const char* signalTypeToString(SignalType type) {
    return type == SignalType::BUY ? "buy" : "sell";
}

} // namespace signalbench
