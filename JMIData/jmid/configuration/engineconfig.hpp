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

/*! \file jmid/configuration/engineconfig.hpp
    \brief Configuration of one evaluation cycle
    \ingroup configuration
*/

#pragma once

#include <jmid/configuration/creditriskconfig.hpp>
#include <jmid/configuration/marketdataconfig.hpp>
#include <jmid/configuration/meetingcalendar.hpp>
#include <jmid/configuration/rateprobabilityconfig.hpp>

namespace jmi {
namespace data {

/*! Serializable engine configuration, the root node is \c JMIConfig

    Each section is optional and falls back to its defaults when missing.
    \ingroup configuration
*/
class EngineConfig : public XMLSerializable {
public:
    EngineConfig() {}
    EngineConfig(const MarketDataConfig& marketDataConfig, const RateProbabilityConfig& rateProbabilityConfig,
                 const CreditRiskConfig& creditRiskConfig, const MeetingCalendar& meetingCalendar)
        : marketDataConfig_(marketDataConfig), rateProbabilityConfig_(rateProbabilityConfig),
          creditRiskConfig_(creditRiskConfig), meetingCalendar_(meetingCalendar) {}

    //! \name XMLSerializable interface
    //@{
    void fromXML(const XMLNode& node) override;
    XMLNode toXML() const override;
    //@}

    //! \name Inspectors
    //@{
    const MarketDataConfig& marketDataConfig() const { return marketDataConfig_; }
    const RateProbabilityConfig& rateProbabilityConfig() const { return rateProbabilityConfig_; }
    const CreditRiskConfig& creditRiskConfig() const { return creditRiskConfig_; }
    const MeetingCalendar& meetingCalendar() const { return meetingCalendar_; }
    //@}

private:
    MarketDataConfig marketDataConfig_;
    RateProbabilityConfig rateProbabilityConfig_;
    CreditRiskConfig creditRiskConfig_;
    MeetingCalendar meetingCalendar_;
};

} // namespace data
} // namespace jmi
