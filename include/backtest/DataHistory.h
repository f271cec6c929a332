#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array ({time|timestamp|t, open|o, high|h, low|l, close|c, volume|v})
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // 확장자로 로더 선택
    static std::vector<Candle> load(const std::string& file_path);

    // 밀리초 timestamp를 초 단위로 변환
    static Timestamp toSeconds(long long ts);
};

} // namespace backtest
} // namespace signalbench
