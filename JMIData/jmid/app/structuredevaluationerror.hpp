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

/*! \file jmid/app/structuredevaluationerror.hpp
    \brief Structured error for an aborted evaluation cycle
    \ingroup app
*/

#pragma once

#include <jmid/utilities/log.hpp>

namespace jmi {
namespace data {

class StructuredEvaluationErrorMessage : public StructuredMessage {
public:
    StructuredEvaluationErrorMessage(const std::string& context, const std::string& exceptionType,
                                     const std::string& exceptionWhat,
                                     const std::map<std::string, std::string>& subFields = {})
        : StructuredMessage(Category::Error, Group::Analytics, exceptionWhat,
                            std::map<std::string, std::string>({{"exceptionType", exceptionType}, {"context", context}})) {

        if (!subFields.empty())
            subFields_.insert(subFields.begin(), subFields.end());
    }
};

} // namespace data
} // namespace jmi
