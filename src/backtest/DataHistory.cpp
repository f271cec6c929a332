#include "backtest/DataHistory.h"
#include "analytics/CandleSeries.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include "common/Logger.h"

namespace signalbench {
namespace backtest {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// 첫 번째로 존재하는 키의 숫자 값 (문자열 숫자 허용)
double readNumber(const nlohmann::json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!item.contains(key)) continue;
        const auto& val = item[key];
        if (val.is_number()) return val.get<double>();
        if (val.is_string()) return std::stod(val.get<std::string>());
    }
    throw std::invalid_argument(std::string("missing field ") + *keys.begin());
}
}

Timestamp DataHistory::toSeconds(long long ts) {
    // 1e11 초 이후는 현실적인 값이 아니므로 ms로 간주
    return (ts > 100000000000LL) ? ts / 1000 : ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = toSeconds(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return analytics::CandleSeries::normalize(std::move(candles));
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return candles;
    }

    if (!j.is_array()) {
        LOG_ERROR("JSON candle file must contain an array: {}", file_path);
        return candles;
    }

    for (const auto& item : j) {
        try {
            Candle candle;
            candle.timestamp = toSeconds(static_cast<long long>(readNumber(item, {"time", "timestamp", "t"})));
            candle.open = readNumber(item, {"open", "o"});
            candle.high = readNumber(item, {"high", "h"});
            candle.low = readNumber(item, {"low", "l"});
            candle.close = readNumber(item, {"close", "c"});
            candle.volume = readNumber(item, {"volume", "v"});
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Skipping malformed candle: {} - {}", item.dump(), e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return analytics::CandleSeries::normalize(std::move(candles));
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (endsWith(toLowerCopy(file_path), ".json")) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

} // namespace backtest
} // namespace signalbench
