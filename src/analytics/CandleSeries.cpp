#include "analytics/CandleSeries.h"
#include <algorithm>

namespace signalbench {
namespace analytics {

std::vector<Candle> CandleSeries::normalize(std::vector<Candle> candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());
    return candles;
}

} // namespace analytics
} // namespace signalbench
