#pragma once

#include "strategy/IScalpModel.h"

namespace zenith {
namespace strategy {

// 페이크아웃 평균회귀: 직전 봉이 VA 밖으로 나갔다가 현재 종가가 VA 안으로 복귀
class MeanReversionModel : public IScalpModel {
public:
    Model model() const override;
    std::vector<Candidate> evaluate(const ScalpContext& ctx) const override;
};

} // namespace strategy
} // namespace zenith
