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

#include "impute.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(impute_test_tmpdir, ".cordon_impute_test", "Local path for the test to create temporary files in.");

using cordon::FleetType;
using cordon::ImputedDecember;
using cordon::test_helpers::ScopedTestSession;
using cordon::test_helpers::TripSourceCSVHeader;

TEST(Impute, BlendWeighsTheLaterYearMore) {
  EXPECT_DOUBLE_EQ(17.0, cordon::Value(cordon::impute::BlendValues(10.0, 20.0)));
  EXPECT_FALSE(cordon::Exists(cordon::impute::BlendValues(10.0, nullptr)));
  EXPECT_FALSE(cordon::Exists(cordon::impute::BlendValues(nullptr, 20.0)));

  cordon::impute::PeriodStats earlier;
  earlier.trips = 100;
  earlier.avg_fare = 10.0;
  cordon::impute::PeriodStats later;
  later.trips = 200;
  later.avg_fare = 20.0;
  later.avg_surcharge = 2.5;
  const ImputedDecember blended = cordon::impute::Blend(2025, 12, earlier, later);
  EXPECT_EQ(2025, blended.year);
  EXPECT_EQ(12, blended.month);
  EXPECT_DOUBLE_EQ(170.0, blended.trips);
  EXPECT_DOUBLE_EQ(17.0, cordon::Value(blended.avg_fare));
  EXPECT_FALSE(cordon::Exists(blended.avg_distance));
  EXPECT_FALSE(cordon::Exists(blended.avg_surcharge));
}

TEST(Impute, AveragesIgnoreMissingValues) {
  cordon::impute::PeriodStatsAccumulator accumulator;
  EXPECT_EQ(0, accumulator.Stats().trips);
  EXPECT_FALSE(cordon::Exists(accumulator.Stats().avg_fare));

  cordon::TripRecord trip;
  trip.fare = 10.0;
  trip.trip_distance = 1.0;
  trip.congestion_surcharge = 2.5;
  accumulator.Add(trip);
  trip.fare = 20.0;
  trip.trip_distance = 3.0;
  trip.congestion_surcharge = nullptr;
  accumulator.Add(trip);

  const cordon::impute::PeriodStats stats = accumulator.Stats();
  EXPECT_EQ(2, stats.trips);
  EXPECT_DOUBLE_EQ(15.0, cordon::Value(stats.avg_fare));
  EXPECT_DOUBLE_EQ(2.0, cordon::Value(stats.avg_distance));
  EXPECT_DOUBLE_EQ(2.5, cordon::Value(stats.avg_surcharge));
}

TEST(Impute, SynthesizesTheMissingDecember) {
  const ScopedTestSession session(FLAGS_impute_test_tmpdir);
  session.AddMirrorFile("yellow_tripdata_2023-12.csv",
                        TripSourceCSVHeader(FleetType::Yellow) +
                            "2023-12-01 10:00:00,2023-12-01 10:10:00,161,236,2,10,1,14,2.5\n"
                            "2023-12-01 11:00:00,2023-12-01 11:10:00,161,236,4,20,1,24,\n");
  session.AddMirrorFile("green_tripdata_2023-12.csv", TripSourceCSVHeader(FleetType::Green));
  session.AddMirrorFile("yellow_tripdata_2024-12.csv",
                        TripSourceCSVHeader(FleetType::Yellow) +
                            "2024-12-01 10:00:00,2024-12-01 10:10:00,161,236,1,20,1,25,\n"
                            "2024-12-02 10:00:00,2024-12-02 10:10:00,161,236,1,20,1,25,\n");
  session.AddMirrorFile("green_tripdata_2024-12.csv",
                        TripSourceCSVHeader(FleetType::Green) +
                            "2024-12-03 10:00:00,2024-12-03 10:10:00,74,75,1,20,1,25,\n");
  // Not a raw trip file, even though its name mentions the target month.
  session.AddDataFile("weather_40.7812_-73.9665_2024-01-01_2025-12-31.json", "{}");

  std::ostringstream log;
  {
    const cordon::ScopedLogToStream scope(log);
    EXPECT_TRUE(cordon::RunDecemberImputer(*session));
  }
  EXPECT_NE(std::string::npos, log.str().find("2025-12 is missing"));

  const auto rows = session->Output().Read<ImputedDecember>(cordon::tables::kImputedDecember);
  ASSERT_EQ(1u, rows.size());
  EXPECT_EQ(2025, rows[0].year);
  EXPECT_EQ(12, rows[0].month);
  // 0.3 * 2 + 0.7 * 3.
  EXPECT_DOUBLE_EQ(2.7, rows[0].trips);
  // 0.3 * 15 + 0.7 * 20.
  EXPECT_DOUBLE_EQ(18.5, cordon::Value(rows[0].avg_fare));
  // 0.3 * 3 + 0.7 * 1.
  EXPECT_DOUBLE_EQ(1.6, cordon::Value(rows[0].avg_distance));
  // No surcharge at all in 2024-12.
  EXPECT_FALSE(cordon::Exists(rows[0].avg_surcharge));
}

TEST(Impute, NothingToDoWhenTheTargetMonthIsPresent) {
  const ScopedTestSession session(FLAGS_impute_test_tmpdir);
  session.AddDataFile("green_tripdata_2025-12.csv", TripSourceCSVHeader(FleetType::Green));
  EXPECT_FALSE(cordon::RunDecemberImputer(*session));
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kImputedDecember));
}

TEST(Impute, MissingReferenceMonthIsFatal) {
  cordon::PipelineConfig config;
  config.december_target_year = 2024;
  const ScopedTestSession session(FLAGS_impute_test_tmpdir, config);
  session.AddMirrorFile("yellow_tripdata_2022-12.csv", TripSourceCSVHeader(FleetType::Yellow));
  session.AddMirrorFile("green_tripdata_2022-12.csv", TripSourceCSVHeader(FleetType::Green));
  session.AddMirrorFile("yellow_tripdata_2023-12.csv", TripSourceCSVHeader(FleetType::Yellow));
  ASSERT_THROW(cordon::RunDecemberImputer(*session), cordon::MissingDependencyException);
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kImputedDecember));
}
