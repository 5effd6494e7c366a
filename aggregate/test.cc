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


#include <sstream>
#include <string>
#include <vector>

#include "aggregate.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(aggregate_test_tmpdir, ".cordon_aggregate_test", "Local path for the test to create temporary files in.");

using cordon::FleetType;
using cordon::TripRecord;
using cordon::TripWithMetrics;
using cordon::ZoneSet;
using cordon::test_helpers::MakeTrip;
using cordon::test_helpers::ScopedTestSession;

namespace aggregate_test {

inline TripWithMetrics Trip(const std::string& pickup, int32_t from, int32_t to, double total) {
  TripWithMetrics trip = MakeTrip(FleetType::Yellow, pickup, pickup, from, to);
  trip.total_amount = total;
  return trip;
}

template <typename ACCUMULATOR, typename ROW>
inline auto Feed(ACCUMULATOR&& accumulator, const std::vector<ROW>& rows) -> decltype(accumulator.Rows()) {
  for (const ROW& row : rows) {
    accumulator.Add(row);
  }
  return accumulator.Rows();
}

}  // namespace aggregate_test

TEST(Aggregate, MonthlyKPIs) {
  std::vector<TripWithMetrics> trips;
  trips.push_back(aggregate_test::Trip("2024-02-10 10:00:00", 1, 2, 20.0));
  trips.back().trip_distance = 2.0;
  trips.back().duration_minutes = 10.0;
  trips.push_back(aggregate_test::Trip("2024-01-31 23:59:59", 1, 2, 10.0));
  trips.back().trip_distance = 1.0;
  trips.back().duration_minutes = 5.0;
  trips.back().congestion_surcharge = 2.5;
  trips.push_back(aggregate_test::Trip("2024-02-01 00:00:00", 1, 2, 30.0));
  trips.back().trip_distance = 4.0;
  trips.back().duration_minutes = 20.0;

  const std::vector<cordon::MonthlyKPI> kpis = aggregate_test::Feed(cordon::aggregate::MonthlyKPIAccumulator(), trips);
  ASSERT_EQ(2u, kpis.size());
  EXPECT_EQ("2024-01", kpis[0].month);
  EXPECT_EQ(1, kpis[0].total_trips);
  EXPECT_EQ(2.5, cordon::Value(kpis[0].congestion_revenue));
  EXPECT_EQ("2024-02", kpis[1].month);
  EXPECT_EQ(2, kpis[1].total_trips);
  EXPECT_DOUBLE_EQ(50.0, kpis[1].total_revenue);
  // No surcharge recorded at all.
  EXPECT_FALSE(cordon::Exists(kpis[1].congestion_revenue));
  EXPECT_DOUBLE_EQ(3.0, kpis[1].avg_distance);
  EXPECT_DOUBLE_EQ(15.0, kpis[1].avg_duration_minutes);

  int64_t total = 0;
  for (const cordon::MonthlyKPI& kpi : kpis) {
    total += kpi.total_trips;
  }
  EXPECT_EQ(static_cast<int64_t>(trips.size()), total);
}

TEST(Aggregate, ZoneCountsByCountThenZone) {
  std::vector<TripWithMetrics> trips;
  for (const int32_t zone : {50, 7, 50, 30, 7, 99}) {
    trips.push_back(aggregate_test::Trip("2024-01-01 00:00:00", zone, 1, 1.5));
  }
  const std::vector<cordon::ZoneCount> counts = aggregate_test::Feed(cordon::aggregate::ZoneCountAccumulator(), trips);
  ASSERT_EQ(4u, counts.size());
  EXPECT_EQ(7, counts[0].pickup_loc);
  EXPECT_EQ(2, counts[0].trip_count);
  EXPECT_DOUBLE_EQ(3.0, counts[0].revenue);
  EXPECT_EQ(50, counts[1].pickup_loc);
  EXPECT_EQ(30, counts[2].pickup_loc);
  EXPECT_EQ(99, counts[3].pickup_loc);
}

TEST(Aggregate, MonthlyLeakage) {
  std::vector<TripWithMetrics> trips;
  trips.push_back(aggregate_test::Trip("2025-03-01 00:00:00", 1, 2, 10.0));
  trips.push_back(aggregate_test::Trip("2025-01-15 00:00:00", 1, 2, 12.5));
  trips.push_back(aggregate_test::Trip("2025-01-16 00:00:00", 1, 2, 7.5));
  const std::vector<cordon::MonthlyLeakage> leakage = aggregate_test::Feed(cordon::aggregate::MonthlyLeakageAccumulator(), trips);
  ASSERT_EQ(2u, leakage.size());
  EXPECT_EQ("2025-01", leakage[0].month);
  EXPECT_EQ(2, leakage[0].leakage_trips);
  EXPECT_DOUBLE_EQ(20.0, leakage[0].leakage_revenue);
  EXPECT_EQ("2025-03", leakage[1].month);
}

TEST(Aggregate, VelocityHeatmapSkipsUndefinedSpeeds) {
  const ZoneSet zone({161});
  std::vector<TripWithMetrics> trips;
  // Sunday, 17:00.
  trips.push_back(aggregate_test::Trip("2025-01-05 17:30:59", 161, 1, 0.0));
  trips.back().duration_minutes = 30.0;
  trips.back().avg_speed_mph = 8.0;
  trips.push_back(aggregate_test::Trip("2025-01-05 17:05:00", 161, 1, 0.0));
  trips.back().duration_minutes = 10.0;
  trips.back().avg_speed_mph = 12.0;
  // Zero duration.
  trips.push_back(aggregate_test::Trip("2025-01-05 17:10:00", 161, 1, 0.0));
  // Zero duration, alone in its cell.
  trips.push_back(aggregate_test::Trip("2025-01-06 09:00:00", 161, 1, 0.0));
  // Outside the zone.
  trips.push_back(aggregate_test::Trip("2025-01-05 17:10:00", 74, 161, 0.0));
  trips.back().duration_minutes = 10.0;
  trips.back().avg_speed_mph = 50.0;

  const std::vector<cordon::HeatmapCell> cells = aggregate_test::Feed(cordon::aggregate::VelocityHeatmapAccumulator(zone), trips);
  ASSERT_EQ(1u, cells.size());
  EXPECT_EQ(0, cells[0].weekday);
  EXPECT_EQ(17, cells[0].hour);
  EXPECT_DOUBLE_EQ(10.0, cells[0].avg_speed);
}

TEST(Aggregate, CrowdingOutOnlyCountsTripsWithAFare) {
  std::vector<TripWithMetrics> trips;
  trips.push_back(aggregate_test::Trip("2024-06-01 10:00:00", 1, 2, 0.0));
  trips.back().fare = 10.0;
  trips.back().tip_amount = 2.0;
  trips.back().congestion_surcharge = 2.5;
  trips.push_back(aggregate_test::Trip("2024-06-02 10:00:00", 1, 2, 0.0));
  trips.back().fare = 20.0;
  trips.back().tip_amount = 2.0;
  // No fare: neither the tip ratio nor the surcharge count.
  trips.push_back(aggregate_test::Trip("2024-06-03 10:00:00", 1, 2, 0.0));
  trips.back().tip_amount = 5.0;
  trips.back().congestion_surcharge = 100.0;
  trips.push_back(aggregate_test::Trip("2024-07-03 10:00:00", 1, 2, 0.0));

  const std::vector<cordon::CrowdingOut> rows = aggregate_test::Feed(cordon::aggregate::CrowdingOutAccumulator(), trips);
  ASSERT_EQ(1u, rows.size());
  EXPECT_EQ("2024-06", rows[0].month);
  EXPECT_DOUBLE_EQ(2.5, cordon::Value(rows[0].avg_surcharge));
  EXPECT_DOUBLE_EQ(0.15, rows[0].avg_tip_ratio);
}

TEST(Aggregate, BorderEffect) {
  const ZoneSet border({41, 74, 127});
  std::vector<TripWithMetrics> trips;
  trips.push_back(aggregate_test::Trip("2024-03-01 10:00:00", 161, 41, 0.0));
  trips.push_back(aggregate_test::Trip("2024-04-01 10:00:00", 161, 41, 0.0));
  trips.push_back(aggregate_test::Trip("2025-03-01 10:00:00", 161, 41, 0.0));
  trips.push_back(aggregate_test::Trip("2025-03-01 10:00:00", 161, 41, 0.0));
  trips.push_back(aggregate_test::Trip("2025-03-01 10:00:00", 161, 41, 0.0));
  trips.push_back(aggregate_test::Trip("2025-05-01 10:00:00", 161, 74, 0.0));
  // Outside the comparison years.
  trips.push_back(aggregate_test::Trip("2023-05-01 10:00:00", 161, 127, 0.0));
  // Not a border zone.
  trips.push_back(aggregate_test::Trip("2024-05-01 10:00:00", 41, 161, 0.0));

  const std::vector<cordon::BorderEffect> rows =
      aggregate_test::Feed(cordon::aggregate::BorderEffectAccumulator(border, 2024, 2025), trips);
  ASSERT_EQ(2u, rows.size());
  EXPECT_EQ(41, rows[0].dropoff_loc);
  EXPECT_EQ(2024, rows[0].year_before);
  EXPECT_EQ(2025, rows[0].year_after);
  EXPECT_EQ(2, rows[0].trips_before);
  EXPECT_EQ(3, rows[0].trips_after);
  EXPECT_DOUBLE_EQ(50.0, cordon::Value(rows[0].percent_change));
  EXPECT_EQ(74, rows[1].dropoff_loc);
  EXPECT_EQ(0, rows[1].trips_before);
  EXPECT_EQ(1, rows[1].trips_after);
  EXPECT_FALSE(cordon::Exists(rows[1].percent_change));
}

TEST(Aggregate, FleetDeclineCountsFirstQuarterEntries) {
  const ZoneSet zone({161});
  std::vector<TripRecord> trips;
  trips.push_back(MakeTrip(FleetType::Yellow, "2024-01-10 10:00:00", "", 74, 161));
  trips.push_back(MakeTrip(FleetType::Yellow, "2025-03-31 23:00:00", "", 74, 161));
  trips.push_back(MakeTrip(FleetType::Green, "2024-02-10 10:00:00", "", 75, 161));
  trips.push_back(MakeTrip(FleetType::Green, "2024-02-11 10:00:00", "", 75, 161));
  // April.
  trips.push_back(MakeTrip(FleetType::Green, "2024-04-01 00:00:00", "", 75, 161));
  // Not entering.
  trips.push_back(MakeTrip(FleetType::Yellow, "2024-01-10 10:00:00", "", 161, 161));
  // Not a comparison year.
  trips.push_back(MakeTrip(FleetType::Yellow, "2023-01-10 10:00:00", "", 74, 161));

  const std::vector<cordon::FleetQuarter> rows =
      aggregate_test::Feed(cordon::aggregate::FleetDeclineAccumulator(zone, 2024, 2025), trips);
  ASSERT_EQ(3u, rows.size());
  EXPECT_TRUE(rows[0].taxi_type == FleetType::Yellow);
  EXPECT_EQ(2024, rows[0].year);
  EXPECT_EQ(1, rows[0].trips);
  EXPECT_TRUE(rows[1].taxi_type == FleetType::Yellow);
  EXPECT_EQ(2025, rows[1].year);
  EXPECT_TRUE(rows[2].taxi_type == FleetType::Green);
  EXPECT_EQ(2024, rows[2].year);
  EXPECT_EQ(2, rows[2].trips);
}

TEST(Aggregate, RainImpactTreatsMissingWeatherAsDry) {
  std::vector<TripWithMetrics> trips;
  // Two trips on a rainy day, one on a day with zero precipitation, three on a day with a null value,
  // and one on a day absent from the series.
  for (const char* pickup : {"2024-01-01 08:00:00",
                             "2024-01-01 09:00:00",
                             "2024-01-02 08:00:00",
                             "2024-01-03 08:00:00",
                             "2024-01-03 09:00:00",
                             "2024-01-03 10:00:00",
                             "2024-01-04 08:00:00"}) {
    trips.push_back(aggregate_test::Trip(pickup, 1, 2, 0.0));
  }
  std::vector<cordon::DailyWeather> weather(3);
  weather[0].trip_date = "2024-01-01";
  weather[0].precipitation = 4.2;
  weather[1].trip_date = "2024-01-02";
  weather[1].precipitation = 0.0;
  weather[2].trip_date = "2024-01-03";

  const std::vector<cordon::RainImpact> rows = aggregate_test::Feed(cordon::aggregate::RainImpactAccumulator(weather), trips);
  ASSERT_EQ(2u, rows.size());
  EXPECT_FALSE(rows[0].rainy);
  EXPECT_DOUBLE_EQ(5.0 / 3.0, rows[0].avg_trips);
  EXPECT_TRUE(rows[1].rainy);
  EXPECT_DOUBLE_EQ(2.0, rows[1].avg_trips);
}

namespace aggregate_test {

inline void PersistInputs(const cordon::Session& session) {
  session.Output().Write(cordon::tables::kCongestionZone, std::vector<cordon::ZoneId>({cordon::ZoneId(161)}));
  session.Output().Write(cordon::tables::kBorderZones, std::vector<cordon::ZoneId>({cordon::ZoneId(41)}));
  std::vector<TripWithMetrics> clean;
  clean.push_back(Trip("2024-01-02 10:00:00", 74, 161, 20.0));
  clean.push_back(Trip("2025-01-02 10:00:00", 161, 41, 20.0));
  session.Output().Write(cordon::tables::kCleanTrips, clean);
  session.Output().Write(cordon::tables::kLeakageTrips, std::vector<TripWithMetrics>({clean[0]}));
  session.Output().Write(cordon::tables::kUnifiedTrips, std::vector<TripRecord>(clean.begin(), clean.end()));
  cordon::DailyWeather day;
  day.trip_date = "2024-01-02";
  day.precipitation = 1.0;
  session.Data().Write(cordon::tables::kWeather, std::vector<cordon::DailyWeather>({day}));
}

}  // namespace aggregate_test

TEST(Aggregate, RunsEveryPass) {
  for (const bool parallel : {true, false}) {
    cordon::PipelineConfig config;
    config.parallel_aggregations = parallel;
    const ScopedTestSession session(FLAGS_aggregate_test_tmpdir, config);
    aggregate_test::PersistInputs(*session);
    cordon::RunAggregations(*session);
    for (const cordon::aggregate::Pass& pass : cordon::aggregate::AllPasses()) {
      EXPECT_TRUE(session->Output().Exists(pass.table)) << pass.table;
    }
    const auto fleet = session->Output().Read<cordon::FleetQuarter>(cordon::tables::kFleetDecline);
    ASSERT_EQ(1u, fleet.size());
    EXPECT_EQ(2024, fleet[0].year);
    const auto rain = session->Output().Read<cordon::RainImpact>(cordon::tables::kRainTax);
    ASSERT_EQ(2u, rain.size());
    EXPECT_DOUBLE_EQ(1.0, rain[1].avg_trips);
  }
}

TEST(Aggregate, AFailedPassFailsTheRunAfterTheOthersFinish) {
  for (const bool parallel : {true, false}) {
    cordon::PipelineConfig config;
    config.parallel_aggregations = parallel;
    const ScopedTestSession session(FLAGS_aggregate_test_tmpdir, config);
    aggregate_test::PersistInputs(*session);
    cordon::FileSystem::RmFile(session->Data().TablePath(cordon::tables::kWeather));

    std::ostringstream log;
    {
      const cordon::ScopedLogToStream scope(log);
      ASSERT_THROW(cordon::RunAggregations(*session), cordon::MissingTableException);
    }
    EXPECT_NE(std::string::npos, log.str().find("Aggregation `rain_tax` failed"));
    EXPECT_FALSE(session->Output().Exists(cordon::tables::kRainTax));
    EXPECT_TRUE(session->Output().Exists(cordon::tables::kMonthlyKPIs));
    EXPECT_TRUE(session->Output().Exists(cordon::tables::kBorderEffect));
  }
}

TEST(Aggregate, AnyFailureOfAPassIsRethrownAfterTheOthersFinish) {
  for (const bool parallel : {true, false}) {
    cordon::PipelineConfig config;
    config.parallel_aggregations = parallel;
    const ScopedTestSession session(FLAGS_aggregate_test_tmpdir, config);
    aggregate_test::PersistInputs(*session);
    std::vector<cordon::aggregate::Pass> passes;
    passes.push_back({"unexpected", [](const cordon::Session&) { throw 42; }});
    passes.push_back({cordon::tables::kZoneCounts, cordon::aggregate::RunZoneCounts});

    std::ostringstream log;
    {
      const cordon::ScopedLogToStream scope(log);
      ASSERT_THROW(cordon::RunAggregations(*session, passes), int);
    }
    EXPECT_NE(std::string::npos, log.str().find("Aggregation `unexpected` failed."));
    EXPECT_NE(std::string::npos, log.str().find("Aggregation `dashboard_zone_counts` done."));
    EXPECT_TRUE(session->Output().Exists(cordon::tables::kZoneCounts));
  }
}
