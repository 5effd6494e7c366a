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


// Trip records, from the canonical unified record to the derived metrics computed by the ghost filter.

#ifndef CORDON_SCHEMA_TYPES_H
#define CORDON_SCHEMA_TYPES_H

#include "../port.h"

#include <chrono>
#include <string>

#include "../bricks/time/chrono.h"
#include "../bricks/util/optional.h"
#include "../storage/archives.h"

namespace cordon {

enum class FleetType : int { Yellow = 0, Green = 1 };

constexpr FleetType kAllFleets[] = {FleetType::Yellow, FleetType::Green};

inline const char* FleetTypeAsString(FleetType fleet) { return fleet == FleetType::Yellow ? "Yellow" : "Green"; }

inline bool FleetTypeFromString(const std::string& s, FleetType& fleet) {
  if (s == "Yellow") {
    fleet = FleetType::Yellow;
    return true;
  } else if (s == "Green") {
    fleet = FleetType::Green;
    return true;
  } else {
    return false;
  }
}

// Raw source files are named `yellow_tripdata_2024-01.csv`, `green_tripdata_2024-01.csv`.
inline std::string FleetTypeAsFilePrefix(FleetType fleet) { return fleet == FleetType::Yellow ? "yellow" : "green"; }

inline void WriteColumnValue(JSONWriter& writer, FleetType fleet) { writer.String(FleetTypeAsString(fleet)); }

inline bool ReadColumnValue(const rapidjson::Value& json, FleetType& fleet) {
  return json.IsString() && FleetTypeFromString(json.GetString(), fleet);
}

typedef Optional<std::chrono::microseconds> OptionalTimestamp;

// The canonical trip record, as written into `unified_trips`.
// Nothing about it is validated: a dropoff before the pickup is a valid record, and exactly what the ghost filter
// is there to catch.
struct TripRecord {
  FleetType taxi_type = FleetType::Yellow;
  OptionalTimestamp pickup_time;
  OptionalTimestamp dropoff_time;
  int32_t pickup_loc = 0;
  int32_t dropoff_loc = 0;
  double trip_distance = 0.0;
  double fare = 0.0;
  double tip_amount = 0.0;
  double total_amount = 0.0;
  Optional<double> congestion_surcharge;

  template <typename A>
  void Serialize(A& ar) {
    ar("taxi_type", taxi_type);
    ar("pickup_time", pickup_time);
    ar("dropoff_time", dropoff_time);
    ar("pickup_loc", pickup_loc);
    ar("dropoff_loc", dropoff_loc);
    ar("trip_distance", trip_distance);
    ar("fare", fare);
    ar("tip_amount", tip_amount);
    ar("total_amount", total_amount);
    ar("congestion_surcharge", congestion_surcharge);
  }
};

// `clean_trips`, `audit_log`, and `leakage_trips`. The metrics are computed once, by the ghost filter.
struct TripWithMetrics : TripRecord {
  double duration_minutes = 0.0;
  double avg_speed_mph = 0.0;

  template <typename A>
  void Serialize(A& ar) {
    TripRecord::Serialize(ar);
    ar("duration_minutes", duration_minutes);
    ar("avg_speed_mph", avg_speed_mph);
  }
};

// Calendar fields of the pickup, if the pickup time is known.
inline bool PickupFields(const TripRecord& trip, time::CivilFields& fields) {
  if (!Exists(trip.pickup_time)) {
    return false;
  }
  fields = time::BreakDown(Value(trip.pickup_time));
  return true;
}

}  // namespace cordon

#endif  // CORDON_SCHEMA_TYPES_H
