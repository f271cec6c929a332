#pragma once

#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace analytics {

class CandleSeries {
public:
    // 시간순 정렬 + 중복 timestamp 제거 (첫 캔들 유지)
    static std::vector<Candle> normalize(std::vector<Candle> candles);
};

} // namespace analytics
} // namespace signalbench
