/*
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <jmid/marketdata/governmentcurve.hpp>
#include <jmid/utilities/errors.hpp>

#include <ql/math/comparison.hpp>
#include <ql/math/interpolations/linearinterpolation.hpp>

#include <algorithm>
#include <cmath>

namespace jmi {
namespace data {

GovernmentCurve::GovernmentCurve(const std::vector<GovernmentCurvePoint>& points) : points_(points) {
    std::sort(points_.begin(), points_.end(), [](const GovernmentCurvePoint& a, const GovernmentCurvePoint& b) {
        return a.maturityYears() < b.maturityYears();
    });
    for (const auto& p : points_) {
        JMI_REQUIRE(p.maturityYears() > 0.0, DataValidationError,
                    "government curve point with non-positive maturity " << p.maturityYears());
        JMI_REQUIRE(std::isfinite(p.yield()), DataValidationError,
                    "government curve point at maturity " << p.maturityYears() << " has a non-finite yield");
        JMI_REQUIRE(times_.empty() || p.maturityYears() > times_.back(), DataValidationError,
                    "duplicate government curve maturity " << p.maturityYears());
        times_.push_back(p.maturityYears());
        yields_.push_back(p.yield());
    }
    JMI_REQUIRE(times_.size() >= 2, DataValidationError,
                "government curve needs at least two points with distinct maturities, got " << times_.size());
}

Real GovernmentCurve::yield(Real t) const {
    JMI_REQUIRE(std::isfinite(t) && t >= times_.front() && t <= times_.back(), CurveLookupError,
                "maturity " << t << " is outside the government curve range [" << times_.front() << ", "
                            << times_.back() << "]");
    for (std::size_t i = 0; i < times_.size(); ++i) {
        if (QuantLib::close_enough(times_[i], t))
            return yields_[i];
    }
    QuantLib::LinearInterpolation interpolation(times_.begin(), times_.end(), yields_.begin());
    return interpolation(t);
}

} // namespace data
} // namespace jmi
