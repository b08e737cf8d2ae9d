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

/*! \file jmid/configuration/creditriskconfig.hpp
    \brief Class for holding the credit model configuration
    \ingroup configuration
*/

#pragma once

#include <jmid/utilities/xmlutils.hpp>

#include <ql/types.hpp>

namespace jmi {
namespace data {

/*! Serializable configuration of the credit risk model

    The five year horizon is the ranking horizon and is always part of the reported horizons.
    If \c continueOnError is set, a bond whose maturity is outside the government curve is skipped with a warning
    instead of failing the evaluation.
    \ingroup configuration
*/
class CreditRiskConfig : public XMLSerializable {
public:
    //! Default constructor, recovery 10%, horizons 1, 3, 5 and 10 years
    CreditRiskConfig();
    CreditRiskConfig(QuantLib::Real recoveryRate, const std::vector<QuantLib::Real>& horizons = {1.0, 3.0, 5.0, 10.0},
                     bool continueOnError = false);

    //! \name XMLSerializable interface
    //@{
    void fromXML(const XMLNode& node) override;
    XMLNode toXML() const override;
    //@}

    //! \name Inspectors
    //@{
    QuantLib::Real recoveryRate() const { return recoveryRate_; }
    //! Sorted, unique and containing the five year horizon
    const std::vector<QuantLib::Real>& horizons() const { return horizons_; }
    bool continueOnError() const { return continueOnError_; }
    //@}

    static constexpr QuantLib::Real rankingHorizon = 5.0;

private:
    QuantLib::Real recoveryRate_;
    std::vector<QuantLib::Real> horizons_;
    bool continueOnError_;

    void build();
};

} // namespace data
} // namespace jmi
