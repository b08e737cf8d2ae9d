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

#include <jmid/configuration/creditriskconfig.hpp>
#include <jmid/utilities/errors.hpp>

#include <ql/math/comparison.hpp>

#include <algorithm>
#include <cmath>

namespace jmi {
namespace data {

CreditRiskConfig::CreditRiskConfig()
    : recoveryRate_(0.10), horizons_({1.0, 3.0, 5.0, 10.0}), continueOnError_(false) {}

CreditRiskConfig::CreditRiskConfig(QuantLib::Real recoveryRate, const std::vector<QuantLib::Real>& horizons,
                                   bool continueOnError)
    : recoveryRate_(recoveryRate), horizons_(horizons), continueOnError_(continueOnError) {
    build();
}

void CreditRiskConfig::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "CreditRisk");
    recoveryRate_ = XMLUtils::getChildValueAsDouble(node, "RecoveryRate", false, 0.10);
    horizons_ = XMLUtils::getChildrenValuesAsDoublesCompact(node, "Horizons", false);
    if (horizons_.empty())
        horizons_ = {1.0, 3.0, 5.0, 10.0};
    continueOnError_ = XMLUtils::getChildValueAsBool(node, "ContinueOnError", false, false);
    build();
}

XMLNode CreditRiskConfig::toXML() const {
    XMLNode node = XMLUtils::makeNode("CreditRisk");
    XMLUtils::addChild(node, "RecoveryRate", recoveryRate_);
    XMLUtils::addChildrenCompact(node, "Horizons", horizons_);
    XMLUtils::addChild(node, "ContinueOnError", continueOnError_);
    return node;
}

void CreditRiskConfig::build() {
    JMI_REQUIRE(std::isfinite(recoveryRate_) && recoveryRate_ >= 0.0 && recoveryRate_ < 1.0, DataValidationError,
                "RecoveryRate (" << recoveryRate_ << ") should be in [0, 1).");
    for (auto h : horizons_) {
        JMI_REQUIRE(std::isfinite(h) && h >= 0.0, InvalidTenorError, "Horizon (" << h << ") should be non-negative.");
    }
    horizons_.push_back(rankingHorizon);
    std::sort(horizons_.begin(), horizons_.end());
    horizons_.erase(std::unique(horizons_.begin(), horizons_.end(),
                                [](QuantLib::Real a, QuantLib::Real b) { return QuantLib::close_enough(a, b); }),
                    horizons_.end());
}

} // namespace data
} // namespace jmi
