#pragma once

#include "strategy/IScalpModel.h"

namespace zenith {
namespace strategy {

// EMA50 교차 후 되돌림 + 스윙 돌파
class Ema50RetestModel : public IScalpModel {
public:
    Model model() const override;
    std::vector<Candidate> evaluate(const ScalpContext& ctx) const override;
};

} // namespace strategy
} // namespace zenith
