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


// The aggregation passes, as accumulators: `Add()` every input row, in any number, then take `Rows()`.
// The state of a pass is bounded by the number of its groups, never by the number of trips.
//
// Every output is sorted by its key, so that re-running a pass over the same inputs rewrites the same bytes.

#ifndef CORDON_AGGREGATE_PASSES_H
#define CORDON_AGGREGATE_PASSES_H

#include "../port.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "../bricks/time/chrono.h"
#include "../bricks/util/optional.h"
#include "../schema/tables.h"
#include "../zones/zones.h"

namespace cordon {
namespace aggregate {

// The mean of the values added, no value if none were.
class MeanAccumulator final {
 public:
  void Add(double x) {
    sum_ += x;
    ++count_;
  }
  void Add(const Optional<double>& x) {
    if (Exists(x)) {
      Add(Value(x));
    }
  }
  Optional<double> Mean() const {
    if (count_) {
      return sum_ / count_;
    } else {
      return nullptr;
    }
  }

 private:
  double sum_ = 0.0;
  int64_t count_ = 0;
};

// The sum of the values added, no value if none were. Missing values are skipped.
class SumAccumulator final {
 public:
  void Add(const Optional<double>& x) {
    if (Exists(x)) {
      sum_ += Value(x);
      any_ = true;
    }
  }
  Optional<double> Sum() const {
    if (any_) {
      return sum_;
    } else {
      return nullptr;
    }
  }

 private:
  double sum_ = 0.0;
  bool any_ = false;
};

class MonthlyKPIAccumulator final {
 public:
  void Add(const TripWithMetrics& trip) {
    if (!Exists(trip.pickup_time)) {
      return;
    }
    Group& group = groups_[FormatYearMonth(Value(trip.pickup_time))];
    ++group.trips;
    group.revenue += trip.total_amount;
    group.surcharge.Add(trip.congestion_surcharge);
    group.distance.Add(trip.trip_distance);
    group.duration.Add(trip.duration_minutes);
  }

  std::vector<MonthlyKPI> Rows() const {
    std::vector<MonthlyKPI> result;
    for (const auto& cit : groups_) {
      MonthlyKPI row;
      row.month = cit.first;
      row.total_trips = cit.second.trips;
      row.total_revenue = cit.second.revenue;
      row.congestion_revenue = cit.second.surcharge.Sum();
      row.avg_distance = Value(cit.second.distance.Mean());
      row.avg_duration_minutes = Value(cit.second.duration.Mean());
      result.push_back(row);
    }
    return result;
  }

 private:
  struct Group {
    int64_t trips = 0;
    double revenue = 0.0;
    SumAccumulator surcharge;
    MeanAccumulator distance;
    MeanAccumulator duration;
  };
  std::map<std::string, Group> groups_;
};

// By trip count descending, then by zone id.
class ZoneCountAccumulator final {
 public:
  void Add(const TripWithMetrics& trip) {
    ZoneCount& group = groups_[trip.pickup_loc];
    group.pickup_loc = trip.pickup_loc;
    ++group.trip_count;
    group.revenue += trip.total_amount;
  }

  std::vector<ZoneCount> Rows() const {
    std::vector<ZoneCount> result;
    for (const auto& cit : groups_) {
      result.push_back(cit.second);
    }
    std::stable_sort(result.begin(), result.end(), [](const ZoneCount& lhs, const ZoneCount& rhs) {
      return lhs.trip_count > rhs.trip_count;
    });
    return result;
  }

 private:
  std::map<int32_t, ZoneCount> groups_;
};

// Over the leakage trips.
class MonthlyLeakageAccumulator final {
 public:
  void Add(const TripWithMetrics& trip) {
    if (!Exists(trip.pickup_time)) {
      return;
    }
    const std::string month = FormatYearMonth(Value(trip.pickup_time));
    MonthlyLeakage& group = groups_[month];
    group.month = month;
    ++group.leakage_trips;
    group.leakage_revenue += trip.total_amount;
  }

  std::vector<MonthlyLeakage> Rows() const {
    std::vector<MonthlyLeakage> result;
    for (const auto& cit : groups_) {
      result.push_back(cit.second);
    }
    return result;
  }

 private:
  std::map<std::string, MonthlyLeakage> groups_;
};

// The speed is only defined for a positive duration.
class VelocityHeatmapAccumulator final {
 public:
  explicit VelocityHeatmapAccumulator(const ZoneSet& congestion_zone) : congestion_zone_(congestion_zone) {}

  void Add(const TripWithMetrics& trip) {
    time::CivilFields pickup;
    if (!congestion_zone_.count(trip.pickup_loc) || trip.duration_minutes <= 0.0 || !PickupFields(trip, pickup)) {
      return;
    }
    cells_[std::make_pair(pickup.weekday, pickup.hour)].Add(trip.avg_speed_mph);
  }

  std::vector<HeatmapCell> Rows() const {
    std::vector<HeatmapCell> result;
    for (const auto& cit : cells_) {
      HeatmapCell cell;
      cell.weekday = cit.first.first;
      cell.hour = cit.first.second;
      cell.avg_speed = Value(cit.second.Mean());
      result.push_back(cell);
    }
    return result;
  }

 private:
  const ZoneSet& congestion_zone_;
  std::map<std::pair<int32_t, int32_t>, MeanAccumulator> cells_;
};

// Only the trips with a fare, hence with a defined tip ratio, count.
class CrowdingOutAccumulator final {
 public:
  void Add(const TripWithMetrics& trip) {
    if (trip.fare <= 0.0 || !Exists(trip.pickup_time)) {
      return;
    }
    Group& group = groups_[FormatYearMonth(Value(trip.pickup_time))];
    group.surcharge.Add(trip.congestion_surcharge);
    group.tip_ratio.Add(trip.tip_amount / trip.fare);
  }

  std::vector<CrowdingOut> Rows() const {
    std::vector<CrowdingOut> result;
    for (const auto& cit : groups_) {
      CrowdingOut row;
      row.month = cit.first;
      row.avg_surcharge = cit.second.surcharge.Mean();
      row.avg_tip_ratio = Value(cit.second.tip_ratio.Mean());
      result.push_back(row);
    }
    return result;
  }

 private:
  struct Group {
    MeanAccumulator surcharge;
    MeanAccumulator tip_ratio;
  };
  std::map<std::string, Group> groups_;
};

// Drop-offs into each border zone, the year before against the year after. A zone with drop-offs in either year
// is listed; the percent change is only defined if there were drop-offs the year before.
class BorderEffectAccumulator final {
 public:
  BorderEffectAccumulator(const ZoneSet& border_zones, int year_before, int year_after)
      : border_zones_(border_zones), year_before_(year_before), year_after_(year_after) {}

  void Add(const TripWithMetrics& trip) {
    time::CivilFields pickup;
    if (!border_zones_.count(trip.dropoff_loc) || !PickupFields(trip, pickup)) {
      return;
    }
    if (pickup.year == year_before_) {
      ++counts_[trip.dropoff_loc].first;
    } else if (pickup.year == year_after_) {
      ++counts_[trip.dropoff_loc].second;
    }
  }

  std::vector<BorderEffect> Rows() const {
    std::vector<BorderEffect> result;
    for (const auto& cit : counts_) {
      BorderEffect row;
      row.dropoff_loc = cit.first;
      row.year_before = year_before_;
      row.year_after = year_after_;
      row.trips_before = cit.second.first;
      row.trips_after = cit.second.second;
      if (row.trips_before > 0) {
        row.percent_change = 100.0 * (row.trips_after - row.trips_before) / row.trips_before;
      }
      result.push_back(row);
    }
    return result;
  }

 private:
  const ZoneSet& border_zones_;
  const int year_before_;
  const int year_after_;
  std::map<int32_t, std::pair<int64_t, int64_t>> counts_;
};

// First-quarter trips entering the congestion zone, per fleet and year. Over the unified trips.
class FleetDeclineAccumulator final {
 public:
  FleetDeclineAccumulator(const ZoneSet& congestion_zone, int year_before, int year_after)
      : congestion_zone_(congestion_zone), year_before_(year_before), year_after_(year_after) {}

  void Add(const TripRecord& trip) {
    time::CivilFields pickup;
    if (!PickupFields(trip, pickup) || pickup.month > 3 || (pickup.year != year_before_ && pickup.year != year_after_)) {
      return;
    }
    if (!congestion_zone_.count(trip.pickup_loc) && congestion_zone_.count(trip.dropoff_loc)) {
      ++counts_[std::make_pair(trip.taxi_type, pickup.year)];
    }
  }

  std::vector<FleetQuarter> Rows() const {
    std::vector<FleetQuarter> result;
    for (const auto& cit : counts_) {
      FleetQuarter row;
      row.taxi_type = cit.first.first;
      row.year = cit.first.second;
      row.trips = cit.second;
      result.push_back(row);
    }
    return result;
  }

 private:
  const ZoneSet& congestion_zone_;
  const int year_before_;
  const int year_after_;
  std::map<std::pair<FleetType, int32_t>, int64_t> counts_;
};

// Days without a weather record, or with no precipitation value, are dry.
class RainImpactAccumulator final {
 public:
  explicit RainImpactAccumulator(const std::vector<DailyWeather>& weather) {
    for (const DailyWeather& day : weather) {
      precipitation_[day.trip_date] = day.precipitation.ValueOrDefault(0.0);
    }
  }

  void Add(const TripWithMetrics& trip) {
    if (Exists(trip.pickup_time)) {
      ++daily_trips_[FormatDate(Value(trip.pickup_time))];
    }
  }

  std::vector<RainImpact> Rows() const {
    std::map<bool, MeanAccumulator> groups;
    for (const auto& cit : daily_trips_) {
      const auto weather_cit = precipitation_.find(cit.first);
      const bool rainy = weather_cit != precipitation_.end() && weather_cit->second > 0.0;
      groups[rainy].Add(static_cast<double>(cit.second));
    }
    std::vector<RainImpact> result;
    for (const auto& cit : groups) {
      RainImpact row;
      row.rainy = cit.first;
      row.avg_trips = Value(cit.second.Mean());
      result.push_back(row);
    }
    return result;
  }

 private:
  std::map<std::string, double> precipitation_;
  std::map<std::string, int64_t> daily_trips_;
};

}  // namespace aggregate
}  // namespace cordon

#endif  // CORDON_AGGREGATE_PASSES_H
