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

#include <jmid/metrics/snapshotstore.hpp>

#include <boost/thread/locks.hpp>
#include <ql/errors.hpp>

namespace jmi {
namespace data {

void InMemorySnapshotStore::store(const QuantLib::ext::shared_ptr<const MetricsSnapshot>& snapshot) {
    QL_REQUIRE(snapshot, "InMemorySnapshotStore: cannot store a null snapshot");
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    snapshots_[snapshot->dataVersion()] = snapshot;
}

bool InMemorySnapshotStore::has(const string& dataVersion) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return snapshots_.find(dataVersion) != snapshots_.end();
}

QuantLib::ext::shared_ptr<const MetricsSnapshot> InMemorySnapshotStore::get(const string& dataVersion) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = snapshots_.find(dataVersion);
    QL_REQUIRE(it != snapshots_.end(), "InMemorySnapshotStore: no snapshot for data version '" << dataVersion << "'");
    return it->second;
}

std::vector<string> InMemorySnapshotStore::dataVersions() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    std::vector<string> res;
    for (const auto& s : snapshots_)
        res.push_back(s.first);
    return res;
}

} // namespace data
} // namespace jmi
