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


// The ghost trip filter.
//
// Computes the duration and the average speed of every trip once, and partitions the trips into the clean ones,
// which feed every downstream stage, and the implausible ones, which go into the audit log and nowhere else.
// No row is modified, only classified.

#ifndef CORDON_GHOST_GHOST_H
#define CORDON_GHOST_GHOST_H

#include "../port.h"

#include <chrono>

#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../pipeline/session.h"
#include "../schema/tables.h"

namespace cordon {
namespace ghost {

constexpr double kMaxPlausibleSpeedMPH = 65.0;
constexpr double kMinPlausibleDurationMinutes = 1.0;
constexpr double kMaxFareForShortTrip = 20.0;

// Requires both timestamps.
inline TripWithMetrics ComputeMetrics(const TripRecord& trip) {
  TripWithMetrics result;
  static_cast<TripRecord&>(result) = trip;
  const double seconds = (Value(trip.dropoff_time) - Value(trip.pickup_time)).count() * 1e-6;
  result.duration_minutes = seconds / 60.0;
  result.avg_speed_mph = seconds > 0.0 ? trip.trip_distance / (seconds / 3600.0) : 0.0;
  return result;
}

inline bool IsGhostTrip(const TripWithMetrics& trip) {
  return trip.avg_speed_mph > kMaxPlausibleSpeedMPH ||
         (trip.duration_minutes < kMinPlausibleDurationMinutes && trip.fare > kMaxFareForShortTrip) ||
         (trip.trip_distance == 0.0 && trip.fare > 0.0);
}

enum class Verdict { Clean, Ghost, BeforeCutoff, MissingTimestamp };

struct FilterCounts {
  size_t clean = 0u;
  size_t ghost = 0u;
  size_t before_cutoff = 0u;
  size_t missing_timestamps = 0u;
};

class GhostTripFilter final {
 public:
  explicit GhostTripFilter(int cutoff_year) : cutoff_year_(cutoff_year) {}

  // Fills `with_metrics` for the clean and the ghost trips only.
  Verdict Classify(const TripRecord& trip, TripWithMetrics& with_metrics) {
    if (!Exists(trip.pickup_time) || !Exists(trip.dropoff_time)) {
      // The duration of such a trip is undefined, so it is neither clean nor provably a ghost.
      ++counts_.missing_timestamps;
      return Verdict::MissingTimestamp;
    }
    if (time::BreakDown(Value(trip.pickup_time)).year < cutoff_year_) {
      ++counts_.before_cutoff;
      return Verdict::BeforeCutoff;
    }
    with_metrics = ComputeMetrics(trip);
    if (IsGhostTrip(with_metrics)) {
      ++counts_.ghost;
      return Verdict::Ghost;
    }
    ++counts_.clean;
    return Verdict::Clean;
  }

  const FilterCounts& Counts() const { return counts_; }

 private:
  const int cutoff_year_;
  FilterCounts counts_;
};

}  // namespace ghost

inline ghost::FilterCounts RunGhostFilter(const Session& session) {
  ghost::GhostTripFilter filter(session.Config().quality_cutoff_year);
  const auto audit_log = session.Output().OpenWriter<TripWithMetrics>(tables::kAuditLog);
  const auto clean = session.Output().OpenWriter<TripWithMetrics>(tables::kCleanTrips);
  session.Output().ForEach<TripRecord>(tables::kUnifiedTrips, [&](TripRecord&& trip) {
    TripWithMetrics with_metrics;
    const ghost::Verdict verdict = filter.Classify(trip, with_metrics);
    if (verdict == ghost::Verdict::Clean) {
      clean->Add(with_metrics);
    } else if (verdict == ghost::Verdict::Ghost) {
      audit_log->Add(with_metrics);
    }
  });
  const ghost::FilterCounts& counts = filter.Counts();
  if (counts.missing_timestamps) {
    Log().Warning("Dropped " + strings::ToString(counts.missing_timestamps) + " trips with a missing timestamp.");
  }
  Log().Info("Ghost filter: " + strings::ToString(counts.clean) + " clean, " + strings::ToString(counts.ghost) +
             " ghost, " + strings::ToString(counts.before_cutoff) + " before " +
             strings::ToString(session.Config().quality_cutoff_year) + '.');
  audit_log->Commit();
  clean->Commit();
  return counts;
}

}  // namespace cordon

#endif  // CORDON_GHOST_GHOST_H
