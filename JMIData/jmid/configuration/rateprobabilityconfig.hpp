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

/*! \file jmid/configuration/rateprobabilityconfig.hpp
    \brief Class for holding the policy rate model configuration
    \ingroup configuration
*/

#pragma once

#include <jmid/utilities/xmlutils.hpp>

#include <ql/types.hpp>

namespace jmi {
namespace data {

//! Policy step sizes, a positive hike step and a negative cut step
struct PolicyStepSizes {
    PolicyStepSizes(QuantLib::Real hikeStep = 0.0025, QuantLib::Real cutStep = -0.0025)
        : hike(hikeStep), cut(cutStep) {}
    QuantLib::Real hike;
    QuantLib::Real cut;
};

/*! Serializable configuration of the policy rate probability model
    \ingroup configuration
*/
class RateProbabilityConfig : public XMLSerializable {
public:
    //! Default constructor, 25bp steps and a one day overnight tenor
    RateProbabilityConfig();
    RateProbabilityConfig(const PolicyStepSizes& stepSizes, QuantLib::Integer overnightTenorDays = 1);

    //! \name XMLSerializable interface
    //@{
    void fromXML(const XMLNode& node) override;
    XMLNode toXML() const override;
    //@}

    //! \name Inspectors
    //@{
    const PolicyStepSizes& stepSizes() const { return stepSizes_; }
    QuantLib::Integer overnightTenorDays() const { return overnightTenorDays_; }
    //@}

private:
    PolicyStepSizes stepSizes_;
    QuantLib::Integer overnightTenorDays_;

    void check() const;
};

} // namespace data
} // namespace jmi
