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

/*! \file jmid/app/jmiapp.hpp
    \brief JMI application class
    \ingroup app
*/

#pragma once

#include <jmid/app/parameters.hpp>
#include <jmid/metrics/metricsaggregator.hpp>

#include <boost/timer/timer.hpp>

namespace jmi {
namespace data {

//! Orchestrates one evaluation cycle driven by a parameter file
/*! The cycle loads the OIS and bond files named in the \c Setup group, runs the metrics aggregator and writes the
    rate probability report, the credit profile report and the snapshot json to the output path.

    Repeated calls to run() reuse the same aggregator, so that earlier snapshots stay available by data version.
    \ingroup app
 */
class JMIApp {
public:
    JMIApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console = false);

    virtual ~JMIApp();

    //! Runs one evaluation cycle, returns false if the cycle failed, the failure is logged
    virtual bool run();

    //! Aggregator holding the published snapshots, null before the first run
    const QuantLib::ext::shared_ptr<MetricsAggregator>& aggregator() const { return aggregator_; }

    //! time for executing run() in seconds
    Real getRunTime();

    static std::string version();

protected:
    //! Read the setup from the parameters, set up the log and build the aggregator if required
    void initFromParams();
    //! Read the OIS and bond files
    RawMarketData loadMarketData() const;
    //! Write the reports for the given snapshot to the output path
    void writeReports(const MetricsSnapshot& snapshot) const;

    void setupLog(const std::string& path, const std::string& file, QuantLib::Size mask);
    void closeLog();

    QuantLib::ext::shared_ptr<Parameters> params_;
    bool console_;

    std::string inputPath_;
    std::string outputPath_;
    std::string logFile_;
    QuantLib::Size logMask_;
    QuantLib::Date asof_;

    QuantLib::ext::shared_ptr<MetricsAggregator> aggregator_;

private:
    boost::timer::cpu_timer runTimer_;
};

} // namespace data
} // namespace jmi
