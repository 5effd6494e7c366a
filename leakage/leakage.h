/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


// The leakage auditor: of the clean trips entering the congestion zone after the policy went live,
// how many paid the surcharge, and which did not.

#ifndef CORDON_LEAKAGE_LEAKAGE_H
#define CORDON_LEAKAGE_LEAKAGE_H

#include "../port.h"

#include <algorithm>
#include <map>
#include <vector>

#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../pipeline/session.h"
#include "../schema/tables.h"
#include "../zones/zones.h"

namespace cordon {
namespace leakage {

constexpr size_t kTopPickupZones = 3u;

// A trip entering the zone starts outside of it and ends inside.
inline bool IsEnteringTrip(const TripRecord& trip, const ZoneSet& congestion_zone) {
  return !congestion_zone.count(trip.pickup_loc) && congestion_zone.count(trip.dropoff_loc);
}

inline bool PaidSurcharge(const TripRecord& trip) {
  return Exists(trip.congestion_surcharge) && Value(trip.congestion_surcharge) > 0.0;
}

// Leakage trips per pickup zone. Zones with equal counts keep the order of their first leakage trip.
class PickupZoneCounter final {
 public:
  void Add(int32_t pickup_loc) {
    const auto cit = index_.find(pickup_loc);
    if (cit == index_.end()) {
      index_[pickup_loc] = counts_.size();
      LeakagePickup pickup;
      pickup.pickup_loc = pickup_loc;
      pickup.leakage_count = 1;
      counts_.push_back(pickup);
    } else {
      ++counts_[cit->second].leakage_count;
    }
  }

  std::vector<LeakagePickup> Top(size_t limit) const {
    std::vector<LeakagePickup> result = counts_;
    std::stable_sort(result.begin(), result.end(), [](const LeakagePickup& lhs, const LeakagePickup& rhs) {
      return lhs.leakage_count > rhs.leakage_count;
    });
    if (result.size() > limit) {
      result.resize(limit);
    }
    return result;
  }

 private:
  std::vector<LeakagePickup> counts_;
  std::map<int32_t, size_t> index_;
};

class LeakageAuditor final {
 public:
  LeakageAuditor(const ZoneSet& congestion_zone, int policy_cutoff_year)
      : congestion_zone_(congestion_zone), policy_cutoff_year_(policy_cutoff_year) {}

  // Returns whether `trip` is a leakage trip: entering the zone once the policy is live, without the surcharge.
  bool Add(const TripWithMetrics& trip) {
    time::CivilFields pickup;
    if (!PickupFields(trip, pickup) || pickup.year < policy_cutoff_year_ || !IsEnteringTrip(trip, congestion_zone_)) {
      return false;
    }
    ++compliance_.total_entering;
    if (PaidSurcharge(trip)) {
      ++compliance_.compliant_trips;
      return false;
    }
    pickups_.Add(trip.pickup_loc);
    return true;
  }

  const ComplianceStats& Compliance() const { return compliance_; }

  std::vector<LeakagePickup> TopPickups() const { return pickups_.Top(kTopPickupZones); }

 private:
  const ZoneSet& congestion_zone_;
  const int policy_cutoff_year_;
  ComplianceStats compliance_;
  PickupZoneCounter pickups_;
};

}  // namespace leakage

inline ComplianceStats RunLeakageAuditor(const Session& session) {
  const ZoneSet congestion_zone = ReadZoneSet(session.Output(), tables::kCongestionZone);
  leakage::LeakageAuditor auditor(congestion_zone, session.Config().policy_cutoff_year);
  const auto leakage = session.Output().OpenWriter<TripWithMetrics>(tables::kLeakageTrips);
  session.Output().ForEach<TripWithMetrics>(tables::kCleanTrips, [&auditor, &leakage](TripWithMetrics&& trip) {
    if (auditor.Add(trip)) {
      leakage->Add(trip);
    }
  });
  const ComplianceStats compliance = auditor.Compliance();
  session.Output().Write(tables::kComplianceStats, std::vector<ComplianceStats>({compliance}));
  leakage->Commit();
  session.Output().Write(tables::kTopLeakagePickups, auditor.TopPickups());
  Log().Info("Leakage audit: " + strings::ToString(compliance.compliant_trips) + " of " +
             strings::ToString(compliance.total_entering) + " entering trips paid the surcharge.");
  return compliance;
}

}  // namespace cordon

#endif  // CORDON_LEAKAGE_LEAKAGE_H
