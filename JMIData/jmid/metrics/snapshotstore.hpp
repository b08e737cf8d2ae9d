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

/*! \file jmid/metrics/snapshotstore.hpp
    \brief Retention of historical snapshots
    \ingroup metrics
*/

#pragma once

#include <jmid/metrics/metricssnapshot.hpp>

#include <boost/thread/shared_mutex.hpp>
#include <ql/shared_ptr.hpp>

#include <map>

namespace jmi {
namespace data {

//! Interface of a store of published snapshots, keyed by data version
/*! \ingroup metrics
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() {}

    //! Store a snapshot, replacing any snapshot with the same data version
    virtual void store(const QuantLib::ext::shared_ptr<const MetricsSnapshot>& snapshot) = 0;
    virtual bool has(const string& dataVersion) const = 0;
    //! Throws if there is no snapshot for the data version
    virtual QuantLib::ext::shared_ptr<const MetricsSnapshot> get(const string& dataVersion) const = 0;
    //! All stored data versions in ascending order
    virtual std::vector<string> dataVersions() const = 0;
};

//! Snapshot store keeping all snapshots in memory
/*! \ingroup metrics
 */
class InMemorySnapshotStore : public SnapshotStore {
public:
    void store(const QuantLib::ext::shared_ptr<const MetricsSnapshot>& snapshot) override;
    bool has(const string& dataVersion) const override;
    QuantLib::ext::shared_ptr<const MetricsSnapshot> get(const string& dataVersion) const override;
    std::vector<string> dataVersions() const override;

private:
    std::map<string, QuantLib::ext::shared_ptr<const MetricsSnapshot>> snapshots_;
    mutable boost::shared_mutex mutex_;
};

} // namespace data
} // namespace jmi
