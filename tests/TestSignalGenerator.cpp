#include "strategy/SignalGenerator.h"
#include "strategy/EmaCrossDetector.h"
#include "strategy/RsiDivergenceDetector.h"
#include "strategy/MacdCrossDetector.h"
#include "TestHelpers.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace signalbench;
using namespace signalbench::strategy;
using namespace signalbench::testing;

namespace {
// 완만한 하락 150개 후 급등 5개: EMA7이 EMA25를 EMA99 위에서 상향 돌파
std::vector<Candle> emaCrossSeries() {
    std::vector<double> closes;
    for (int i = 0; i < 150; ++i) closes.push_back(200.0 - 0.5 * i);
    for (int m = 1; m <= 5; ++m) closes.push_back(closes.back() + 20.0);
    return fromCloses(closes);
}

// 하락 3 / 상승 1 반복. 상승 봉은 긴 아래꼬리로 저점 갱신 -> RSI 강세 다이버전스
std::vector<Candle> rsiDivergenceSeries() {
    std::vector<Candle> candles;
    double prev = 200.0;
    for (int i = 0; i < 60; ++i) {
        double open = prev;
        double close = prev;
        double low = prev - 0.5;
        if (i > 0 && i % 2 == 1) {
            close = prev - 3.0;
            low = close - 0.5;
        } else if (i > 0) {
            close = prev + 1.0;
            low = open - 1.0;
        }
        const double high = std::max(open, close) + 0.5;
        candles.emplace_back(open, high, low, close, 1000.0, i * 60);
        prev = close;
    }
    return candles;
}

// 완만한 상승 150개 후 급락 5개: EMA7이 EMA25를 EMA99 아래에서 하향 돌파
std::vector<Candle> emaCrossDownSeries() {
    std::vector<double> closes;
    for (int i = 0; i < 150; ++i) closes.push_back(100.0 + 0.5 * i);
    for (int m = 1; m <= 5; ++m) closes.push_back(closes.back() - 20.0);
    return fromCloses(closes);
}

// 상승 3 / 하락 1 반복. 하락 봉은 긴 위꼬리로 고점 갱신 -> RSI 약세 다이버전스
std::vector<Candle> rsiBearishSeries() {
    std::vector<Candle> candles;
    double prev = 100.0;
    for (int i = 0; i < 60; ++i) {
        double open = prev;
        double close = prev;
        double high = prev + 0.5;
        if (i > 0 && i % 2 == 1) {
            close = prev + 3.0;
            high = close + 0.5;
        } else if (i > 0) {
            close = prev - 1.0;
            high = open + 1.0;
        }
        const double low = std::min(open, close) - 0.5;
        candles.emplace_back(open, high, low, close, 1000.0, i * 60);
        prev = close;
    }
    return candles;
}

// 60개 상승 후 60개 하락 (MACD 데드 크로스 1회)
std::vector<Candle> invertedVSeries() {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) closes.push_back(100.0 + i);
    for (int i = 1; i <= 60; ++i) closes.push_back(159.0 - i);
    return fromCloses(closes);
}
}

int main() {
    // Flat market produces no crossings
    {
        std::vector<Candle> flat;
        for (int i = 0; i < 30; ++i) {
            flat.emplace_back(100.0, 101.0, 99.0, 100.0, 1000.0, i * 60);
        }
        assert(EmaCrossDetector(EmaCrossParams{7, 25}).detect(flat).empty());

        StrategyConfig config;
        config.params = EmaCrossParams{7, 25};
        assert(SignalGenerator::generateSignals(flat, config).empty());
    }

    // EMA cross detector
    {
        auto candles = emaCrossSeries();
        EmaCrossDetector detector(EmaCrossParams{7, 25});
        assert(detector.minimumHistory() == 99);

        auto signals = detector.detect(candles);
        bool found_buy = false;
        for (const auto& signal : signals) {
            if (signal.type == SignalType::BUY) {
                assert(signal.time >= candles[150].timestamp);
                assert(signal.reason == "EMA 7 crossed above EMA 25 with trend confirmation");
                found_buy = true;
            }
        }
        assert(found_buy);

        // 99개 미만이면 빈 결과
        std::vector<Candle> short_series(candles.end() - 98, candles.end());
        assert(detector.detect(short_series).empty());

        // 하향 돌파 + EMA99 아래 + 음봉 -> sell
        auto down = emaCrossDownSeries();
        auto down_signals = detector.detect(down);
        assert(down_signals.size() == 2);
        assert(down_signals[0].type == SignalType::BUY);
        assert(down_signals[0].time == down[1].timestamp);
        assert(down_signals[1].type == SignalType::SELL);
        assert(down_signals[1].time == down[151].timestamp);
        assert(down_signals[1].price == down[151].close);
        assert(down[151].close < down[151].open);
        assert(down_signals[1].reason == "EMA 7 crossed below EMA 25 with trend confirmation");

        // 선행 sell은 교대 검증에서 제거
        StrategyConfig config;
        config.params = EmaCrossParams{7, 25};
        auto validated = SignalGenerator::generateSignals(candles, config);
        assert(!validated.empty());
        assert(validated.front().type == SignalType::BUY);
        assert(isStrictlyAlternating(validated));
    }

    // RSI divergence detector
    {
        auto candles = rsiDivergenceSeries();
        RsiDivergenceDetector detector(RsiDivergenceParams{14, 70.0, 30.0});
        assert(detector.minimumHistory() == 34);

        auto signals = detector.detect(candles);
        assert(!signals.empty());
        for (const auto& signal : signals) {
            assert(signal.type == SignalType::BUY);
            assert(signal.reason == "RSI bullish divergence");
            const auto index = static_cast<size_t>(signal.time / 60);
            assert(candles[index].close > candles[index].open);
            assert(candles[index].low < candles[index - 1].low);
        }

        std::vector<Candle> short_series(candles.begin(), candles.begin() + 33);
        assert(detector.detect(short_series).empty());

        // 연속 buy는 첫 번째만 남음
        StrategyConfig config;
        config.params = RsiDivergenceParams{14, 70.0, 30.0};
        auto validated = SignalGenerator::generateSignals(candles, config);
        assert(validated.size() == 1);
        assert(validated.front().time == signals.front().time);

        // 과매수 구간에서 고점 갱신 + RSI 하락 -> sell
        auto bearish = rsiBearishSeries();
        auto sells = detector.detect(bearish);
        assert(!sells.empty());
        assert(sells.front().time == bearish[20].timestamp);
        for (const auto& signal : sells) {
            assert(signal.type == SignalType::SELL);
            assert(signal.reason == "RSI bearish divergence");
            const auto index = static_cast<size_t>(signal.time / 60);
            assert(index % 2 == 0);
            assert(bearish[index].close < bearish[index].open);
            assert(bearish[index].high > bearish[index - 1].high);
        }

        // sell만 있으면 교대 검증 후 비어 있음
        assert(SignalGenerator::generateSignals(bearish, config).empty());
    }

    // MACD cross detector
    {
        auto candles = vShapedSeries();
        MacdCrossDetector detector;
        auto signals = detector.detect(candles);

        bool found_buy = false;
        for (const auto& signal : signals) {
            assert(signal.strength.has_value());
            assert(*signal.strength >= 0.0);
            if (signal.type == SignalType::BUY) {
                assert(signal.time == candles[60].timestamp);
                assert(*signal.strength > 0.0);
                found_buy = true;
            }
        }
        assert(found_buy);

        // 첫 하락 봉에서 데드 크로스
        assert(signals.size() == 2);
        assert(signals[0].type == SignalType::SELL);
        assert(signals[0].time == candles[1].timestamp);
        assert(signals[0].reason == "MACD crossed below signal line with negative momentum");

        auto peak = invertedVSeries();
        auto peak_signals = detector.detect(peak);
        assert(peak_signals.size() == 2);
        assert(peak_signals[0].type == SignalType::BUY);
        assert(peak_signals[0].reason == "MACD crossed above signal line with positive momentum");
        assert(peak_signals[1].type == SignalType::SELL);
        assert(peak_signals[1].time == peak[60].timestamp);
        assert(peak_signals[1].reason == "MACD crossed below signal line with negative momentum");
        assert(*peak_signals[1].strength > 0.0);

        std::vector<Candle> short_series(candles.begin(), candles.begin() + 25);
        assert(detector.detect(short_series).empty());

        // strength가 min_strength 이하인 교차는 제거 (index 1: ~0.064, index 60: ~0.070)
        MacdCrossDetector strong_only(MacdCrossParams{0.067});
        auto strong = strong_only.detect(candles);
        assert(strong.size() == 1);
        assert(strong[0].type == SignalType::BUY);
        assert(strong[0].time == candles[60].timestamp);
        assert(MacdCrossDetector(MacdCrossParams{1.0}).detect(candles).empty());
    }

    // Alternation validation: sorted by time, starts with buy, duplicates dropped
    {
        std::vector<Signal> raw{
            Signal(5, SignalType::SELL, 10.0),
            Signal(1, SignalType::SELL, 10.0),
            Signal(3, SignalType::BUY, 10.0),
            Signal(2, SignalType::BUY, 10.0),
            Signal(4, SignalType::SELL, 10.0),
            Signal(6, SignalType::BUY, 10.0),
        };
        auto validated = SignalGenerator::validateAlternation(raw);
        assert(validated.size() == 3);
        assert(validated[0].time == 2 && validated[0].type == SignalType::BUY);
        assert(validated[1].time == 4 && validated[1].type == SignalType::SELL);
        assert(validated[2].time == 6 && validated[2].type == SignalType::BUY);

        // 같은 시각이면 입력 순서 유지
        std::vector<Signal> ties{
            Signal(7, SignalType::BUY, 1.0, "first"),
            Signal(7, SignalType::BUY, 2.0, "second"),
        };
        auto tie_result = SignalGenerator::validateAlternation(ties);
        assert(tie_result.size() == 1);
        assert(tie_result[0].reason == "first");

        assert(SignalGenerator::validateAlternation({}).empty());
    }

    // Volume filter
    {
        auto candles = vShapedSeries();
        StrategyConfig config;
        config.params = MacdCrossParams{};
        config.volume.enabled = true;
        config.volume.threshold = 1.5;

        // 교차 캔들 거래량이 평균 대비 낮으면 제거
        assert(SignalGenerator::generateSignals(candles, config).empty());

        candles[60].volume = 5000.0;
        auto signals = SignalGenerator::generateSignals(candles, config);
        assert(signals.size() == 1);
        assert(signals[0].type == SignalType::BUY);
        assert(signals[0].time == candles[60].timestamp);

        // threshold <= 0 이면 기본값 1.5
        std::vector<Signal> one{Signal(candles[60].timestamp, SignalType::BUY, 1.0)};
        assert(SignalGenerator::filterByVolume(one, candles, 0.0).size() == 1);
        assert(SignalGenerator::filterByVolume({}, candles, 1.5).empty());
    }

    // Timeframe window
    {
        std::vector<Candle> daily;
        for (int i = 0; i < 200; ++i) {
            daily.push_back(makeCandle(static_cast<Timestamp>(i) * 86400, 100.0, 100.0));
        }

        TimeframeWindow all;
        assert(SignalGenerator::filterByTimeframe(daily, all).size() == 200);

        TimeframeWindow month;
        month.timeframe = Timeframe::ONE_MONTH;
        auto last_month = SignalGenerator::filterByTimeframe(daily, month);
        assert(last_month.size() == 30);
        assert(last_month.front().timestamp == daily[170].timestamp);

        TimeframeWindow quarter;
        quarter.timeframe = Timeframe::THREE_MONTHS;
        quarter.reference_time = daily[99].timestamp;
        auto windowed = SignalGenerator::filterByTimeframe(daily, quarter);
        assert(windowed.front().timestamp == daily[10].timestamp);

        // 창 밖 캔들에서만 발생하는 신호는 사라짐
        auto candles = vShapedSeries();
        StrategyConfig config;
        config.params = MacdCrossParams{};
        config.window.timeframe = Timeframe::ONE_MONTH;
        config.window.reference_time = candles.back().timestamp + 40LL * 86400;
        assert(SignalGenerator::generateSignals(candles, config).empty());
    }

    // Multi: union of detectors, always a clean alternating stream
    {
        auto detectors = SignalGenerator::createDetectors(
            MultiParams{EmaCrossParams{7, 25}, RsiDivergenceParams{}, MacdCrossParams{}});
        assert(detectors.size() == 3);
        assert(detectors[0]->getName() == "ema_cross");
        assert(detectors[1]->getName() == "rsi_oversold");
        assert(detectors[2]->getName() == "macd_cross");

        MultiParams macd_only;
        macd_only.macd_cross = MacdCrossParams{};
        assert(SignalGenerator::createDetectors(macd_only).size() == 1);

        std::vector<double> closes;
        for (int i = 0; i < 400; ++i) {
            closes.push_back(100.0 + 15.0 * std::sin(i * 0.08) + 5.0 * std::sin(i * 0.41));
        }
        auto candles = fromCloses(closes);

        StrategyConfig config;
        auto signals = SignalGenerator::generateSignals(candles, config);
        assert(!signals.empty());
        assert(isStrictlyAlternating(signals));
        for (size_t i = 1; i < signals.size(); ++i) {
            assert(signals[i - 1].time <= signals[i].time);
        }

        // 재호출 결과 동일 (내부 상태 없음)
        auto again = SignalGenerator::generateSignals(candles, config);
        assert(again.size() == signals.size());

        // 역순 입력도 정렬 후 처리
        std::vector<Candle> reversed(candles.rbegin(), candles.rend());
        assert(SignalGenerator::generateSignals(reversed, config).size() == signals.size());

        assert(SignalGenerator::generateSignals({}, config).empty());
        assert(SignalGenerator::generateSignals({candles[0]}, config).empty());
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
