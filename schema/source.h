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


// Readers for the raw inputs: the per-month trip files of both fleets and the zone lookup.
//
// The two fleets name their pickup and dropoff time columns differently; every other column has the same name.
// Columns are located by header name. A missing required column is a structural failure of the source file,
// while an empty or unparseable value in a present column is data: numbers load as zero, and timestamps and
// the surcharge load as no value.

#ifndef CORDON_SCHEMA_SOURCE_H
#define CORDON_SCHEMA_SOURCE_H

#include "../port.h"

#include <cmath>
#include <string>
#include <vector>

#include "exceptions.h"
#include "types.h"

#include "../blocks/csv/csv.h"
#include "../bricks/strings/strings.h"
#include "../bricks/time/chrono.h"
#include "../storage/exceptions.h"

namespace cordon {

constexpr char kZoneLookupFileName[] = "taxi_zone_lookup.csv";

struct TripFilePeriod {
  FleetType fleet = FleetType::Yellow;
  int year = 0;
  int month = 0;
};

inline std::string TripFileName(FleetType fleet, int year, int month) {
  return FleetTypeAsFilePrefix(fleet) + "_tripdata_" + FormatYearMonth(year, month) + ".csv";
}

// Accepts exactly the names `TripFileName()` produces.
inline bool ParseTripFileName(const std::string& name, TripFilePeriod& period) {
  for (const FleetType fleet : kAllFleets) {
    const std::string prefix = FleetTypeAsFilePrefix(fleet) + "_tripdata_";
    // "YYYY-MM.csv".
    if (name.length() == prefix.length() + 11u && name.compare(0u, prefix.length(), prefix) == 0) {
      const std::string period_string = name.substr(prefix.length());
      if (period_string[4] != '-' || period_string.compare(7u, 4u, ".csv") != 0) {
        return false;
      }
      for (const size_t i : {0u, 1u, 2u, 3u, 5u, 6u}) {
        if (period_string[i] < '0' || period_string[i] > '9') {
          return false;
        }
      }
      const int month = FromString<int>(period_string.substr(5u, 2u));
      if (month < 1 || month > 12) {
        return false;
      }
      period.fleet = fleet;
      period.year = FromString<int>(period_string.substr(0u, 4u));
      period.month = month;
      return true;
    }
  }
  return false;
}

namespace source {

struct Columns {
  const char* pickup_time;
  const char* dropoff_time;
};

inline Columns ColumnsForFleet(FleetType fleet) {
  if (fleet == FleetType::Yellow) {
    return Columns{"tpep_pickup_datetime", "tpep_dropoff_datetime"};
  } else {
    return Columns{"lpep_pickup_datetime", "lpep_dropoff_datetime"};
  }
}

constexpr char kPickupLoc[] = "PULocationID";
constexpr char kDropoffLoc[] = "DOLocationID";
constexpr char kTripDistance[] = "trip_distance";
constexpr char kFare[] = "fare_amount";
constexpr char kTip[] = "tip_amount";
constexpr char kTotal[] = "total_amount";
constexpr char kCongestionSurcharge[] = "congestion_surcharge";

// Zone ids exported through a floating point column come as "161.0".
inline int32_t ParseZoneId(const std::string& s) {
  int32_t id = 0;
  if (strings::TryFromString(s, id)) {
    return id;
  }
  double value = 0.0;
  if (strings::TryFromString(s, value) && value == std::floor(value) && value >= 0.0 && value <= 2147483647.0) {
    return static_cast<int32_t>(value);
  }
  return 0;
}

inline Optional<double> ParseOptionalNumber(const std::string& s) {
  double value = 0.0;
  if (strings::TryFromString(s, value) && std::isfinite(value)) {
    return value;
  } else {
    return nullptr;
  }
}

inline double ParseNumber(const std::string& s) { return ParseOptionalNumber(s).ValueOrDefault(0.0); }

inline size_t RequireColumn(const CSVReader& reader, const std::string& file_name, const std::string& column) {
  if (!reader.HasColumn(column)) {
    CORDON_THROW(SourceFormatException("The source file `" + file_name + "` has no required column `" + column +
                                       "`."));
  }
  return reader.ColumnIndex(column);
}

// Runs `f()` over a CSV file, reporting a missing file as a missing dependency, and a malformed one
// as a malformed source.
template <typename F>
inline void WithSourceCSV(const std::string& file_name, F&& f) {
  try {
    CSVReader reader(file_name);
    f(reader);
  } catch (const CSVFileNotFoundException& e) {
    CORDON_THROW(MissingDependencyException(e.OriginalDescription()));
  } catch (const CSVException& e) {
    CORDON_THROW(SourceFormatException(e.OriginalDescription()));
  }
}

}  // namespace source

// Calls `f(TripRecord&&)` for every row of a raw trip file of the given fleet, in file order.
template <typename F>
inline size_t ForEachSourceTrip(const std::string& file_name, FleetType fleet, F&& f) {
  size_t rows = 0u;
  source::WithSourceCSV(file_name, [&](CSVReader& reader) {
    const source::Columns columns = source::ColumnsForFleet(fleet);
    const size_t pickup_time = source::RequireColumn(reader, file_name, columns.pickup_time);
    const size_t dropoff_time = source::RequireColumn(reader, file_name, columns.dropoff_time);
    const size_t pickup_loc = source::RequireColumn(reader, file_name, source::kPickupLoc);
    const size_t dropoff_loc = source::RequireColumn(reader, file_name, source::kDropoffLoc);
    const size_t trip_distance = source::RequireColumn(reader, file_name, source::kTripDistance);
    const size_t fare = source::RequireColumn(reader, file_name, source::kFare);
    const size_t tip_amount = source::RequireColumn(reader, file_name, source::kTip);
    const size_t total_amount = source::RequireColumn(reader, file_name, source::kTotal);
    const size_t congestion_surcharge = source::RequireColumn(reader, file_name, source::kCongestionSurcharge);
    rows = reader.ForEachRow([&](const CSVReader::Row& row) {
      TripRecord trip;
      trip.taxi_type = fleet;
      trip.pickup_time = ParseCivilDateTime(row[pickup_time]);
      trip.dropoff_time = ParseCivilDateTime(row[dropoff_time]);
      trip.pickup_loc = source::ParseZoneId(row[pickup_loc]);
      trip.dropoff_loc = source::ParseZoneId(row[dropoff_loc]);
      trip.trip_distance = source::ParseNumber(row[trip_distance]);
      trip.fare = source::ParseNumber(row[fare]);
      trip.tip_amount = source::ParseNumber(row[tip_amount]);
      trip.total_amount = source::ParseNumber(row[total_amount]);
      trip.congestion_surcharge = source::ParseOptionalNumber(row[congestion_surcharge]);
      f(std::move(trip));
    });
  });
  return rows;
}

struct ZoneLookupEntry {
  int32_t location_id = 0;
  std::string borough;
  std::string zone;
  std::string service_zone;
};

inline std::vector<ZoneLookupEntry> ReadZoneLookup(const std::string& file_name) {
  std::vector<ZoneLookupEntry> result;
  source::WithSourceCSV(file_name, [&](CSVReader& reader) {
    const size_t location_id = source::RequireColumn(reader, file_name, "LocationID");
    const size_t borough = source::RequireColumn(reader, file_name, "Borough");
    const size_t zone = source::RequireColumn(reader, file_name, "Zone");
    const bool has_service_zone = reader.HasColumn("service_zone");
    const size_t service_zone = has_service_zone ? reader.ColumnIndex("service_zone") : 0u;
    reader.ForEachRow([&](const CSVReader::Row& row) {
      ZoneLookupEntry entry;
      entry.location_id = source::ParseZoneId(row[location_id]);
      entry.borough = row[borough];
      entry.zone = row[zone];
      if (has_service_zone) {
        entry.service_zone = row[service_zone];
      }
      result.push_back(std::move(entry));
    });
  });
  return result;
}

}  // namespace cordon

#endif  // CORDON_SCHEMA_SOURCE_H
