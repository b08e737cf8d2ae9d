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

/*! \file jmid/marketdata/governmentcurve.hpp
    \brief Government benchmark yield curve
    \ingroup marketdata
*/

#pragma once

#include <jmid/marketdata/marketdatum.hpp>

#include <vector>

namespace jmi {
namespace data {

//! Government benchmark yield curve
/*!
  Yields are interpolated linearly in maturity between the curve points and are exact at the points. There is no
  extrapolation, a maturity outside [minMaturity(), maxMaturity()] raises a CurveLookupError.

  \ingroup marketdata
*/
class GovernmentCurve {
public:
    //! The points are sorted by maturity, at least two points with distinct maturities are required
    explicit GovernmentCurve(const std::vector<GovernmentCurvePoint>& points);

    Real yield(Real maturityYears) const;

    //! \name Inspectors
    //@{
    const std::vector<GovernmentCurvePoint>& points() const { return points_; }
    Real minMaturity() const { return times_.front(); }
    Real maxMaturity() const { return times_.back(); }
    //@}

private:
    std::vector<GovernmentCurvePoint> points_;
    std::vector<Real> times_, yields_;
};

} // namespace data
} // namespace jmi
