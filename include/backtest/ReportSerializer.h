#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace backtest {

// 리포트/차트 협력 컴포넌트용 JSON 변환
class ReportSerializer {
public:
    static nlohmann::json toJson(const Signal& signal);
    static nlohmann::json toJson(const Trade& trade);
    static nlohmann::json toJson(const PerformanceStats& stats);
    static nlohmann::json toJson(const StrategyComparison& comparison);

    static nlohmann::json signalsToJson(const std::vector<Signal>& signals);
    static nlohmann::json indicatorToJson(const std::vector<IndicatorPoint>& points);
    static nlohmann::json macdToJson(const std::vector<MACDPoint>& points);
};

} // namespace backtest
} // namespace signalbench
