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

#include <jmid/marketdata/marketdataadapter.hpp>
#include <jmid/metrics/metricsaggregator.hpp>
#include <jmid/utilities/log.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/locks.hpp>
#include <ql/errors.hpp>

namespace jmi {
namespace data {

MetricsSnapshot buildSnapshot(const RateProbabilityResult& rateResult, std::vector<IssuerCreditProfile> creditProfiles,
                              const boost::posix_time::ptime& asOf, const Date& marketDate,
                              const string& dataVersion, const std::vector<CurveSample>& oisCurve,
                              const std::vector<CurveSample>& governmentCurve) {
    rankByDefaultProbability(creditProfiles);
    return MetricsSnapshot(asOf, marketDate, dataVersion, rateResult, creditProfiles, oisCurve, governmentCurve);
}

MetricsAggregator::MetricsAggregator(const EngineConfig& config, const QuantLib::ext::shared_ptr<SnapshotStore>& store)
    : config_(config), store_(store) {}

QuantLib::ext::shared_ptr<const MetricsSnapshot> MetricsAggregator::evaluate(const RawMarketData& raw,
                                                                             const boost::posix_time::ptime& asOf) {
    const RateProbabilityConfig& rateConfig = config_.rateProbabilityConfig();
    MarketDataAdapter adapter(config_.marketDataConfig(), rateConfig.stepSizes().hike);

    RawMarketData data = raw;
    if (data.meetingDates.empty())
        data.meetingDates = config_.meetingCalendar().dates();
    MarketInputs inputs = adapter.adapt(data);

    RateProbabilityResult rateResult = computeRateProbabilities(inputs.oisQuotes, inputs.meeting,
                                                                rateConfig.stepSizes(), rateConfig.overnightTenorDays());
    std::vector<IssuerCreditProfile> profiles =
        computeCreditProfiles(inputs.bondQuotes, *inputs.governmentCurve, config_.creditRiskConfig());

    std::vector<CurveSample> oisCurve = oisCurveSamples(raw.oisQuotes, config_.marketDataConfig().quoteFactor());
    std::vector<CurveSample> governmentCurve = sampleGovernmentCurve(*inputs.governmentCurve);

    QuantLib::ext::shared_ptr<const MetricsSnapshot> snapshot = QuantLib::ext::make_shared<MetricsSnapshot>(
        buildSnapshot(rateResult, profiles, asOf, inputs.sourceDate, inputs.dataVersion, oisCurve, governmentCurve));

    if (store_)
        store_->store(snapshot);
    {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        current_ = snapshot;
    }
    LOG("MetricsAggregator: published snapshot " << snapshot->dataVersion() << " as of "
                                                 << boost::posix_time::to_simple_string(asOf) << " with "
                                                 << snapshot->creditProfiles().size() << " issuers");
    return snapshot;
}

QuantLib::ext::shared_ptr<const MetricsSnapshot> MetricsAggregator::evaluate(const RawMarketData& raw) {
    return evaluate(raw, boost::posix_time::second_clock::universal_time());
}

bool MetricsAggregator::hasSnapshot() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return current_ != nullptr;
}

QuantLib::ext::shared_ptr<const MetricsSnapshot> MetricsAggregator::currentSnapshot() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(current_, "MetricsAggregator: no snapshot has been published yet");
    return current_;
}

QuantLib::ext::shared_ptr<const MetricsSnapshot> MetricsAggregator::snapshot(const string& dataVersion) const {
    QL_REQUIRE(store_, "MetricsAggregator: no snapshot store, historical snapshots are not retained");
    return store_->get(dataVersion);
}

} // namespace data
} // namespace jmi
