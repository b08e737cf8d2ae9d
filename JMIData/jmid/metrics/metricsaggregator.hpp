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

/*! \file jmid/metrics/metricsaggregator.hpp
    \brief Composition of model results into snapshots
    \ingroup metrics
*/

#pragma once

#include <jmid/configuration/engineconfig.hpp>
#include <jmid/marketdata/rawmarketdata.hpp>
#include <jmid/metrics/snapshotstore.hpp>

#include <boost/thread/shared_mutex.hpp>

namespace jmi {
namespace data {

//! Build a snapshot from the model results, the credit profiles are ranked here
MetricsSnapshot buildSnapshot(const RateProbabilityResult& rateResult,
                              std::vector<IssuerCreditProfile> creditProfiles,
                              const boost::posix_time::ptime& asOf, const Date& marketDate = Date(),
                              const string& dataVersion = "", const std::vector<CurveSample>& oisCurve = {},
                              const std::vector<CurveSample>& governmentCurve = {});

//! Metrics aggregator
/*!
  Runs evaluation cycles, raw data to adapter to models to snapshot, and publishes the resulting snapshot.
  A new snapshot is only published if the whole cycle succeeds, a failing cycle leaves the current snapshot as it
  was. Historical snapshots are only available if a snapshot store is given.

  Evaluation and queries may be called concurrently.

  \ingroup metrics
*/
class MetricsAggregator {
public:
    explicit MetricsAggregator(const EngineConfig& config,
                               const QuantLib::ext::shared_ptr<SnapshotStore>& store = nullptr);

    //! Run one evaluation cycle and publish its snapshot, stamped with \p asOf
    QuantLib::ext::shared_ptr<const MetricsSnapshot> evaluate(const RawMarketData& raw,
                                                              const boost::posix_time::ptime& asOf);
    //! Run one evaluation cycle stamped with the current time
    QuantLib::ext::shared_ptr<const MetricsSnapshot> evaluate(const RawMarketData& raw);

    bool hasSnapshot() const;
    //! The last published snapshot, throws if there is none
    QuantLib::ext::shared_ptr<const MetricsSnapshot> currentSnapshot() const;
    //! The snapshot of a historical data version, throws if there is no store or no such version
    QuantLib::ext::shared_ptr<const MetricsSnapshot> snapshot(const string& dataVersion) const;

    const EngineConfig& config() const { return config_; }

private:
    const EngineConfig config_;
    QuantLib::ext::shared_ptr<SnapshotStore> store_;
    QuantLib::ext::shared_ptr<const MetricsSnapshot> current_;
    mutable boost::shared_mutex mutex_;
};

} // namespace data
} // namespace jmi
