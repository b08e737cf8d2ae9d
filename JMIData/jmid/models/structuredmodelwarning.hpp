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

/*! \file jmid/models/structuredmodelwarning.hpp
    \brief Warning for clamped or skipped model estimates
    \ingroup models
*/

#pragma once

#include <jmid/utilities/log.hpp>

namespace jmi {
namespace data {

//! Utility class for Structured Model warnings
class StructuredModelWarningMessage : public StructuredMessage {
public:
    StructuredModelWarningMessage(const std::string& warningType, const std::string& warningWhat,
                                  const std::string& contextId)
        : StructuredMessage(
              Category::Warning, Group::Model, warningWhat,
              std::map<std::string, std::string>({{"warningType", warningType}, {"context-id", contextId}})) {}
};

} // namespace data
} // namespace jmi
