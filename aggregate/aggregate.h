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


// The aggregation engine: the reporting tables, one pass each.
//
// Passes read only persisted tables, share no mutable state, and write only their own table, so they run
// concurrently, one thread per pass. A failed pass fails the run once every other pass has finished.

#ifndef CORDON_AGGREGATE_AGGREGATE_H
#define CORDON_AGGREGATE_AGGREGATE_H

#include "../port.h"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "passes.h"

#include "../bricks/log/log.h"
#include "../pipeline/session.h"
#include "../schema/tables.h"
#include "../zones/zones.h"

namespace cordon {
namespace aggregate {

// Streams the `input` table of the output store through `accumulator`, then writes its rows as `output`.
template <typename ROW, typename ACCUMULATOR>
inline void Accumulate(const Session& session,
                       const std::string& input,
                       ACCUMULATOR& accumulator,
                       const std::string& output) {
  session.Output().ForEach<ROW>(input, [&accumulator](ROW&& row) { accumulator.Add(row); });
  session.Output().Write(output, accumulator.Rows());
}

inline void RunMonthlyKPIs(const Session& session) {
  MonthlyKPIAccumulator kpis;
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, kpis, tables::kMonthlyKPIs);
}

inline void RunZoneCounts(const Session& session) {
  ZoneCountAccumulator counts;
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, counts, tables::kZoneCounts);
}

inline void RunMonthlyLeakage(const Session& session) {
  MonthlyLeakageAccumulator leakage;
  Accumulate<TripWithMetrics>(session, tables::kLeakageTrips, leakage, tables::kMonthlyLeakage);
}

inline void RunVelocityHeatmap(const Session& session) {
  const ZoneSet congestion_zone = ReadZoneSet(session.Output(), tables::kCongestionZone);
  VelocityHeatmapAccumulator heatmap(congestion_zone);
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, heatmap, tables::kVelocityHeatmap);
}

inline void RunCrowdingOut(const Session& session) {
  CrowdingOutAccumulator crowding_out;
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, crowding_out, tables::kCrowdingOut);
}

inline void RunBorderEffect(const Session& session) {
  const ZoneSet border_zones = ReadZoneSet(session.Output(), tables::kBorderZones);
  BorderEffectAccumulator border_effect(
      border_zones, session.Config().comparison_year_before, session.Config().comparison_year_after);
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, border_effect, tables::kBorderEffect);
}

// Over the unified trips, ghost trips included.
inline void RunFleetDecline(const Session& session) {
  const ZoneSet congestion_zone = ReadZoneSet(session.Output(), tables::kCongestionZone);
  FleetDeclineAccumulator fleet_decline(
      congestion_zone, session.Config().comparison_year_before, session.Config().comparison_year_after);
  Accumulate<TripRecord>(session, tables::kUnifiedTrips, fleet_decline, tables::kFleetDecline);
}

// The weather series is small, and is the only input of the data store.
inline void RunRainImpact(const Session& session) {
  RainImpactAccumulator rain_impact(session.Data().Read<DailyWeather>(tables::kWeather));
  Accumulate<TripWithMetrics>(session, tables::kCleanTrips, rain_impact, tables::kRainTax);
}

struct Pass {
  std::string table;
  std::function<void(const Session&)> run;
};

inline std::vector<Pass> AllPasses() {
  return {{tables::kMonthlyKPIs, RunMonthlyKPIs},
          {tables::kZoneCounts, RunZoneCounts},
          {tables::kMonthlyLeakage, RunMonthlyLeakage},
          {tables::kVelocityHeatmap, RunVelocityHeatmap},
          {tables::kCrowdingOut, RunCrowdingOut},
          {tables::kBorderEffect, RunBorderEffect},
          {tables::kFleetDecline, RunFleetDecline},
          {tables::kRainTax, RunRainImpact}};
}

}  // namespace aggregate

inline void RunAggregations(const Session& session, const std::vector<aggregate::Pass>& passes) {
  std::vector<std::exception_ptr> errors(passes.size());
  const auto run = [&session, &passes, &errors](size_t i) {
    try {
      passes[i].run(session);
    } catch (...) {
      // Rethrown below, once every pass has finished.
      errors[i] = std::current_exception();
    }
  };
  if (session.Config().parallel_aggregations) {
    std::vector<std::unique_ptr<std::thread>> threads;
    threads.reserve(passes.size());
    const auto join_all = [&threads]() {
      for (auto& t : threads) {
        t->join();
      }
    };
    try {
      for (size_t i = 0; i < passes.size(); ++i) {
        threads.push_back(std::make_unique<std::thread>(run, i));
      }
    } catch (...) {
      join_all();
      throw;
    }
    join_all();
  } else {
    for (size_t i = 0; i < passes.size(); ++i) {
      run(i);
    }
  }
  std::exception_ptr first_error;
  for (size_t i = 0; i < passes.size(); ++i) {
    if (!errors[i]) {
      Log().Info("Aggregation `" + passes[i].table + "` done.");
      continue;
    }
    try {
      std::rethrow_exception(errors[i]);
    } catch (const std::exception& e) {
      Log().Error("Aggregation `" + passes[i].table + "` failed: " + e.what());
    } catch (...) {
      Log().Error("Aggregation `" + passes[i].table + "` failed.");
    }
    if (!first_error) {
      first_error = errors[i];
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

inline void RunAggregations(const Session& session) { RunAggregations(session, aggregate::AllPasses()); }

}  // namespace cordon

#endif  // CORDON_AGGREGATE_AGGREGATE_H
