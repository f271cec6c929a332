#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace signalbench {
namespace strategy {

// 신호 감지기 인터페이스 (detector마다 1개 구현)
// detect()는 입력 캔들만의 순수 함수. 히스토리 부족 시 빈 목록.
class ISignalDetector {
public:
    virtual ~ISignalDetector() = default;

    virtual std::string getName() const = 0;

    // 신호 생성에 필요한 최소 캔들 수
    virtual size_t minimumHistory() const = 0;

    virtual std::vector<Signal> detect(const std::vector<Candle>& candles) const = 0;
};

} // namespace strategy
} // namespace signalbench
