/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
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

/*! \file jmid/report/metricsreportwriter.hpp
  \brief A Class to write metrics snapshots to reports
  \ingroup report
 */

#pragma once

#include <jmid/metrics/metricssnapshot.hpp>
#include <jmid/report/report.hpp>

#include <string>

namespace jmi {
namespace data {

//! Write metrics snapshots to reports
/*! \ingroup report
 */
class MetricsReportWriter {
public:
    /*! Constructor.
        \param nullString used to represent values that are not applicable.
    */
    MetricsReportWriter(const std::string& nullString = "#NA") : nullString_(nullString) {}

    virtual ~MetricsReportWriter() {}

    //! One row per scenario, hike, cut and no change
    virtual void writeRateProbabilities(Report& report, const MetricsSnapshot& snapshot);

    //! One row per issuer in ranking order, with one default probability column per horizon
    virtual void writeCreditProfiles(Report& report, const MetricsSnapshot& snapshot);

    //! One row per curve point, the OIS curve first and then the sampled government curve
    virtual void writeCurves(Report& report, const MetricsSnapshot& snapshot);

    //! Write MetricsSnapshot::json() to a file
    virtual void writeJson(const std::string& filename, const MetricsSnapshot& snapshot);

protected:
    std::string nullString_;
};

} // namespace data
} // namespace jmi
