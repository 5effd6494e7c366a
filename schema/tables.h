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


// The names and row types of every persisted table. These are the contract with the dashboard:
// column names and types must stay stable.

#ifndef CORDON_SCHEMA_TABLES_H
#define CORDON_SCHEMA_TABLES_H

#include "../port.h"

#include <string>

#include "types.h"

namespace cordon {
namespace tables {

constexpr char kImputedDecember[] = "imputed_december";
constexpr char kUnifiedTrips[] = "unified_trips";
constexpr char kCleanTrips[] = "clean_trips";
constexpr char kAuditLog[] = "audit_log";
constexpr char kCongestionZone[] = "congestion_zone";
constexpr char kBorderZones[] = "border_zones";
constexpr char kComplianceStats[] = "compliance_stats";
constexpr char kLeakageTrips[] = "leakage_trips";
constexpr char kTopLeakagePickups[] = "top_leakage_pickups";
constexpr char kMonthlyKPIs[] = "monthly_kpis";
constexpr char kZoneCounts[] = "dashboard_zone_counts";
constexpr char kMonthlyLeakage[] = "dashboard_leakage";
constexpr char kVelocityHeatmap[] = "velocity_heatmap";
constexpr char kCrowdingOut[] = "crowding_out";
constexpr char kBorderEffect[] = "border_effect";
constexpr char kFleetDecline[] = "q1_yellow_green";
constexpr char kRainTax[] = "rain_tax";

// Kept in the data directory, next to the raw files it is derived from.
constexpr char kWeather[] = "ny_weather";

}  // namespace tables

struct ImputedDecember {
  int32_t year = 0;
  int32_t month = 0;
  double trips = 0.0;
  Optional<double> avg_distance;
  Optional<double> avg_fare;
  Optional<double> avg_total;
  Optional<double> avg_surcharge;

  template <typename A>
  void Serialize(A& ar) {
    ar("year", year);
    ar("month", month);
    ar("trips", trips);
    ar("avg_distance", avg_distance);
    ar("avg_fare", avg_fare);
    ar("avg_total", avg_total);
    ar("avg_surcharge", avg_surcharge);
  }
};

// One zone of `congestion_zone` or `border_zones`.
struct ZoneId {
  int32_t location_id = 0;

  ZoneId() = default;
  explicit ZoneId(int32_t id) : location_id(id) {}

  template <typename A>
  void Serialize(A& ar) {
    ar("LocationID", location_id);
  }
};

struct ComplianceStats {
  int64_t total_entering = 0;
  int64_t compliant_trips = 0;

  template <typename A>
  void Serialize(A& ar) {
    ar("total_entering", total_entering);
    ar("compliant_trips", compliant_trips);
  }
};

struct LeakagePickup {
  int32_t pickup_loc = 0;
  int64_t leakage_count = 0;

  template <typename A>
  void Serialize(A& ar) {
    ar("pickup_loc", pickup_loc);
    ar("leakage_count", leakage_count);
  }
};

struct MonthlyKPI {
  std::string month;
  int64_t total_trips = 0;
  double total_revenue = 0.0;
  Optional<double> congestion_revenue;
  double avg_distance = 0.0;
  double avg_duration_minutes = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("month", month);
    ar("total_trips", total_trips);
    ar("total_revenue", total_revenue);
    ar("congestion_revenue", congestion_revenue);
    ar("avg_distance", avg_distance);
    ar("avg_duration_minutes", avg_duration_minutes);
  }
};

struct ZoneCount {
  int32_t pickup_loc = 0;
  int64_t trip_count = 0;
  double revenue = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("pickup_loc", pickup_loc);
    ar("trip_count", trip_count);
    ar("revenue", revenue);
  }
};

struct MonthlyLeakage {
  std::string month;
  int64_t leakage_trips = 0;
  double leakage_revenue = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("month", month);
    ar("leakage_trips", leakage_trips);
    ar("leakage_revenue", leakage_revenue);
  }
};

// `weekday` is 0 for Sunday.
struct HeatmapCell {
  int32_t weekday = 0;
  int32_t hour = 0;
  double avg_speed = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("weekday", weekday);
    ar("hour", hour);
    ar("avg_speed", avg_speed);
  }
};

struct CrowdingOut {
  std::string month;
  Optional<double> avg_surcharge;
  double avg_tip_ratio = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("month", month);
    ar("avg_surcharge", avg_surcharge);
    ar("avg_tip_ratio", avg_tip_ratio);
  }
};

struct BorderEffect {
  int32_t dropoff_loc = 0;
  int32_t year_before = 0;
  int32_t year_after = 0;
  int64_t trips_before = 0;
  int64_t trips_after = 0;
  // No value when there were no trips in `year_before`.
  Optional<double> percent_change;

  template <typename A>
  void Serialize(A& ar) {
    ar("dropoff_loc", dropoff_loc);
    ar("year_before", year_before);
    ar("year_after", year_after);
    ar("trips_before", trips_before);
    ar("trips_after", trips_after);
    ar("percent_change", percent_change);
  }
};

struct FleetQuarter {
  FleetType taxi_type = FleetType::Yellow;
  int32_t year = 0;
  int64_t trips = 0;

  template <typename A>
  void Serialize(A& ar) {
    ar("taxi_type", taxi_type);
    ar("year", year);
    ar("trips", trips);
  }
};

struct RainImpact {
  bool rainy = false;
  double avg_trips = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    ar("rainy", rainy);
    ar("avg_trips", avg_trips);
  }
};

struct DailyWeather {
  std::string trip_date;
  Optional<double> precipitation;

  template <typename A>
  void Serialize(A& ar) {
    ar("trip_date", trip_date);
    ar("precipitation", precipitation);
  }
};

}  // namespace cordon

#endif  // CORDON_SCHEMA_TABLES_H
