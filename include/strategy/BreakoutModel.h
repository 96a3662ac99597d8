#pragma once

#include "strategy/IScalpModel.h"

namespace zenith {
namespace strategy {

// 밸류에어리어 돌파 모멘텀: 강한 몸통 + 주문흐름 + 대량 체결 + 되돌림 확인
class BreakoutModel : public IScalpModel {
public:
    Model model() const override;
    std::vector<Candidate> evaluate(const ScalpContext& ctx) const override;
};

} // namespace strategy
} // namespace zenith
