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

#include <jmid/configuration/rateprobabilityconfig.hpp>
#include <jmid/utilities/errors.hpp>

#include <ql/errors.hpp>

namespace jmi {
namespace data {

RateProbabilityConfig::RateProbabilityConfig() : overnightTenorDays_(1) {}

RateProbabilityConfig::RateProbabilityConfig(const PolicyStepSizes& stepSizes, QuantLib::Integer overnightTenorDays)
    : stepSizes_(stepSizes), overnightTenorDays_(overnightTenorDays) {
    check();
}

void RateProbabilityConfig::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "RateProbability");
    stepSizes_.hike = XMLUtils::getChildValueAsDouble(node, "HikeStep", false, 0.0025);
    stepSizes_.cut = XMLUtils::getChildValueAsDouble(node, "CutStep", false, -0.0025);
    overnightTenorDays_ = XMLUtils::getChildValueAsInt(node, "OvernightTenorDays", false, 1);
    check();
}

XMLNode RateProbabilityConfig::toXML() const {
    XMLNode node = XMLUtils::makeNode("RateProbability");
    XMLUtils::addChild(node, "HikeStep", stepSizes_.hike);
    XMLUtils::addChild(node, "CutStep", stepSizes_.cut);
    XMLUtils::addChild(node, "OvernightTenorDays", static_cast<int>(overnightTenorDays_));
    return node;
}

void RateProbabilityConfig::check() const {
    JMI_REQUIRE(stepSizes_.hike > 0.0, InvalidStepSizeError,
                "HikeStep (" << stepSizes_.hike << ") should be positive.");
    JMI_REQUIRE(stepSizes_.cut < 0.0, InvalidStepSizeError, "CutStep (" << stepSizes_.cut << ") should be negative.");
    QL_REQUIRE(overnightTenorDays_ >= 0, "OvernightTenorDays (" << overnightTenorDays_ << ") should be non-negative.");
}

} // namespace data
} // namespace jmi
