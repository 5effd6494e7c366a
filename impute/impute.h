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


// The December imputer.
//
// When the raw files of the most recent required month are not published yet, its aggregate statistics are
// synthesized from the same month of the two preceding years, weighted 30% for the earlier and 70% for the later.
// Only aggregate statistics are produced, never per-trip records.

#ifndef CORDON_IMPUTE_IMPUTE_H
#define CORDON_IMPUTE_IMPUTE_H

#include "../port.h"

#include <string>
#include <vector>

#include "../bricks/file/file.h"
#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../fetcher/fetcher.h"
#include "../pipeline/session.h"
#include "../schema/source.h"
#include "../schema/tables.h"
#include "../storage/exceptions.h"

namespace cordon {
namespace impute {

constexpr double kEarlierWeight = 0.3;
constexpr double kLaterWeight = 0.7;

// Means ignore missing values; a mean over no values is no value.
struct PeriodStats {
  int64_t trips = 0;
  Optional<double> avg_distance;
  Optional<double> avg_fare;
  Optional<double> avg_total;
  Optional<double> avg_surcharge;
};

class PeriodStatsAccumulator final {
 public:
  void Add(const TripRecord& trip) {
    ++trips_;
    sum_distance_ += trip.trip_distance;
    sum_fare_ += trip.fare;
    sum_total_ += trip.total_amount;
    if (Exists(trip.congestion_surcharge)) {
      sum_surcharge_ += Value(trip.congestion_surcharge);
      ++surcharges_;
    }
  }

  PeriodStats Stats() const {
    PeriodStats stats;
    stats.trips = trips_;
    if (trips_) {
      stats.avg_distance = sum_distance_ / trips_;
      stats.avg_fare = sum_fare_ / trips_;
      stats.avg_total = sum_total_ / trips_;
    }
    if (surcharges_) {
      stats.avg_surcharge = sum_surcharge_ / surcharges_;
    }
    return stats;
  }

 private:
  int64_t trips_ = 0;
  int64_t surcharges_ = 0;
  double sum_distance_ = 0.0;
  double sum_fare_ = 0.0;
  double sum_total_ = 0.0;
  double sum_surcharge_ = 0.0;
};

inline Optional<double> BlendValues(const Optional<double>& earlier, const Optional<double>& later) {
  if (Exists(earlier) && Exists(later)) {
    return kEarlierWeight * Value(earlier) + kLaterWeight * Value(later);
  } else {
    return nullptr;
  }
}

inline ImputedDecember Blend(int year, int month, const PeriodStats& earlier, const PeriodStats& later) {
  ImputedDecember result;
  result.year = year;
  result.month = month;
  result.trips = kEarlierWeight * earlier.trips + kLaterWeight * later.trips;
  result.avg_distance = BlendValues(earlier.avg_distance, later.avg_distance);
  result.avg_fare = BlendValues(earlier.avg_fare, later.avg_fare);
  result.avg_total = BlendValues(earlier.avg_total, later.avg_total);
  result.avg_surcharge = BlendValues(earlier.avg_surcharge, later.avg_surcharge);
  return result;
}

// Statistics over the union of the given raw trip files. The fleet of each file is taken from its name.
inline PeriodStats ComputePeriodStats(const std::vector<std::string>& file_names) {
  PeriodStatsAccumulator accumulator;
  for (const std::string& file_name : file_names) {
    TripFilePeriod period;
    const std::string base_name = file_name.substr(file_name.rfind(FileSystem::PathSeparatingSlash) + 1u);
    if (!ParseTripFileName(base_name, period)) {
      CORDON_THROW(MissingDependencyException("Not a raw trip file name: `" + file_name + "`."));
    }
    ForEachSourceTrip(file_name, period.fleet, [&accumulator](TripRecord&& trip) { accumulator.Add(trip); });
  }
  return accumulator.Stats();
}

// Whether any raw trip file in `data_dir` covers the given month, of either fleet.
inline bool PeriodIsPresent(const std::string& data_dir, int year, int month) {
  for (const std::string& name : FileSystem::ListFilesSorted(data_dir)) {
    TripFilePeriod period;
    if (ParseTripFileName(name, period) && period.year == year && period.month == month) {
      return true;
    }
  }
  return false;
}

// Both fleets' files of the month, fetched if absent. Any of them unavailable is fatal.
inline std::vector<std::string> RequireReferenceFiles(SourceFetcher& fetcher, int year, int month) {
  std::vector<std::string> files;
  for (const FleetType fleet : kAllFleets) {
    std::string path;
    try {
      path = fetcher.FetchTripFile(fleet, year, month);
    } catch (const SourceNotPublishedException& e) {
      CORDON_THROW(MissingDependencyException("The imputation requires `" + TripFileName(fleet, year, month) +
                                              "`: " + e.OriginalDescription()));
    }
    if (!FileSystem::Exists(path)) {
      CORDON_THROW(MissingDependencyException("The imputation requires `" + path + "`, which is absent."));
    }
    files.push_back(path);
  }
  return files;
}

}  // namespace impute

// Returns `true` if the imputation was performed, `false` if the target month is available and nothing was done.
inline bool RunDecemberImputer(const Session& session) {
  const PipelineConfig& config = session.Config();
  const int year = config.december_target_year;
  const int month = config.december_target_month;
  const std::string target = FormatYearMonth(year, month);
  if (impute::PeriodIsPresent(session.DataDir(), year, month)) {
    Log().Info(target + " is available, no imputation needed.");
    return false;
  }
  Log().Info(target + " is missing, imputing it from " + FormatYearMonth(year - 2, month) + " and " +
             FormatYearMonth(year - 1, month) + '.');
  const std::vector<std::string> earlier_files = impute::RequireReferenceFiles(session.Fetcher(), year - 2, month);
  const std::vector<std::string> later_files = impute::RequireReferenceFiles(session.Fetcher(), year - 1, month);
  const impute::PeriodStats earlier = impute::ComputePeriodStats(earlier_files);
  const impute::PeriodStats later = impute::ComputePeriodStats(later_files);
  session.Output().Write(tables::kImputedDecember,
                         std::vector<ImputedDecember>({impute::Blend(year, month, earlier, later)}));
  Log().Info("Imputed " + target + " from " + strings::ToString(earlier.trips) + " and " +
             strings::ToString(later.trips) + " trips.");
  return true;
}

}  // namespace cordon

#endif  // CORDON_IMPUTE_IMPUTE_H
