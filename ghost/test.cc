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

#include "ghost.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(ghost_test_tmpdir, ".cordon_ghost_test", "Local path for the test to create temporary files in.");

using cordon::FleetType;
using cordon::TripRecord;
using cordon::TripWithMetrics;
using cordon::test_helpers::MakeTrip;
using cordon::test_helpers::ScopedTestSession;

namespace ghost_test {

inline TripWithMetrics Trip(const std::string& pickup, const std::string& dropoff, double distance, double fare) {
  TripWithMetrics trip = MakeTrip(FleetType::Yellow, pickup, dropoff, 100, 161);
  trip.trip_distance = distance;
  trip.fare = fare;
  return trip;
}

}  // namespace ghost_test

TEST(Ghost, Metrics) {
  const TripWithMetrics trip =
      cordon::ghost::ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:30:00", 6.0, 25.0));
  EXPECT_DOUBLE_EQ(30.0, trip.duration_minutes);
  EXPECT_DOUBLE_EQ(12.0, trip.avg_speed_mph);
  EXPECT_EQ(25.0, trip.fare);

  const TripWithMetrics backwards =
      cordon::ghost::ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 09:59:00", 1.0, 5.0));
  EXPECT_DOUBLE_EQ(-1.0, backwards.duration_minutes);
  EXPECT_EQ(0.0, backwards.avg_speed_mph);

  const TripWithMetrics instant =
      cordon::ghost::ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:00:00", 1.0, 5.0));
  EXPECT_EQ(0.0, instant.duration_minutes);
  EXPECT_EQ(0.0, instant.avg_speed_mph);
}

TEST(Ghost, Predicates) {
  using cordon::ghost::ComputeMetrics;
  using cordon::ghost::IsGhostTrip;
  // 70 mph.
  EXPECT_TRUE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 11:00:00", 70, 100))));
  // Exactly 65 mph is plausible.
  EXPECT_FALSE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 11:00:00", 65, 100))));
  // Under a minute, for more than $20.
  EXPECT_TRUE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:00:30", 0.1, 21))));
  EXPECT_FALSE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:00:30", 0.1, 20))));
  // No distance, yet a fare.
  EXPECT_TRUE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:10:00", 0, 3.5))));
  EXPECT_FALSE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:10:00", 0, 0))));
  EXPECT_FALSE(IsGhostTrip(ComputeMetrics(ghost_test::Trip("2024-03-01 10:00:00", "2024-03-01 10:10:00", 2, 12))));
}

TEST(Ghost, PartitionsTheTripsAfterTheCutoff) {
  const ScopedTestSession session(FLAGS_ghost_test_tmpdir);
  std::vector<TripRecord> unified;
  unified.push_back(ghost_test::Trip("2024-01-01 08:00:00", "2024-01-01 08:20:00", 4, 18));
  unified.push_back(ghost_test::Trip("2024-01-01 09:00:00", "2024-01-01 09:01:00", 10, 30));
  unified.push_back(ghost_test::Trip("2022-12-31 23:00:00", "2022-12-31 23:20:00", 4, 18));
  unified.push_back(ghost_test::Trip("2023-01-01 00:05:00", "2023-01-01 00:15:00", 0, 8));
  unified.push_back(ghost_test::Trip("2024-05-05 12:00:00", "", 4, 18));
  unified.push_back(ghost_test::Trip("2024-05-05 13:00:00", "2024-05-05 13:30:00", 5, 22));
  session->Output().Write(cordon::tables::kUnifiedTrips, unified);

  std::ostringstream log;
  {
    const cordon::ScopedLogToStream scope(log);
    const cordon::ghost::FilterCounts counts = cordon::RunGhostFilter(*session);
    EXPECT_EQ(2u, counts.clean);
    EXPECT_EQ(2u, counts.ghost);
    EXPECT_EQ(1u, counts.before_cutoff);
    EXPECT_EQ(1u, counts.missing_timestamps);
  }
  EXPECT_NE(std::string::npos, log.str().find("Dropped 1 trips with a missing timestamp."));

  const auto clean = session->Output().Read<TripWithMetrics>(cordon::tables::kCleanTrips);
  const auto ghosts = session->Output().Read<TripWithMetrics>(cordon::tables::kAuditLog);
  ASSERT_EQ(2u, clean.size());
  ASSERT_EQ(2u, ghosts.size());
  EXPECT_EQ("2024-01-01 08:00:00", cordon::FormatDateTime(cordon::Value(clean[0].pickup_time)));
  EXPECT_EQ("2024-05-05 13:00:00", cordon::FormatDateTime(cordon::Value(clean[1].pickup_time)));
  EXPECT_DOUBLE_EQ(30.0, clean[1].duration_minutes);
  EXPECT_DOUBLE_EQ(10.0, clean[1].avg_speed_mph);
  EXPECT_EQ("2024-01-01 09:00:00", cordon::FormatDateTime(cordon::Value(ghosts[0].pickup_time)));
  EXPECT_DOUBLE_EQ(600.0, ghosts[0].avg_speed_mph);
  EXPECT_EQ("2023-01-01 00:05:00", cordon::FormatDateTime(cordon::Value(ghosts[1].pickup_time)));

  for (const TripWithMetrics& trip : clean) {
    EXPECT_FALSE(cordon::ghost::IsGhostTrip(trip));
  }
  for (const TripWithMetrics& trip : ghosts) {
    EXPECT_TRUE(cordon::ghost::IsGhostTrip(trip));
  }
}

TEST(Ghost, ClassifiesEachTripOnce) {
  cordon::ghost::GhostTripFilter filter(2023);
  TripWithMetrics with_metrics;
  EXPECT_TRUE(filter.Classify(ghost_test::Trip("2024-01-01 08:00:00", "2024-01-01 08:20:00", 4, 18), with_metrics) ==
              cordon::ghost::Verdict::Clean);
  EXPECT_DOUBLE_EQ(20.0, with_metrics.duration_minutes);
  EXPECT_DOUBLE_EQ(12.0, with_metrics.avg_speed_mph);
  EXPECT_TRUE(filter.Classify(ghost_test::Trip("2024-01-01 09:00:00", "2024-01-01 09:01:00", 10, 30), with_metrics) ==
              cordon::ghost::Verdict::Ghost);
  EXPECT_DOUBLE_EQ(600.0, with_metrics.avg_speed_mph);
  EXPECT_TRUE(filter.Classify(ghost_test::Trip("2022-12-31 23:00:00", "2022-12-31 23:20:00", 4, 18), with_metrics) ==
              cordon::ghost::Verdict::BeforeCutoff);
  EXPECT_TRUE(filter.Classify(ghost_test::Trip("", "2024-05-05 12:00:00", 4, 18), with_metrics) ==
              cordon::ghost::Verdict::MissingTimestamp);
  EXPECT_EQ(1u, filter.Counts().clean);
  EXPECT_EQ(1u, filter.Counts().ghost);
  EXPECT_EQ(1u, filter.Counts().before_cutoff);
  EXPECT_EQ(1u, filter.Counts().missing_timestamps);
}

TEST(Ghost, MissingUnifiedTableIsAMissingDependency) {
  const ScopedTestSession session(FLAGS_ghost_test_tmpdir);
  ASSERT_THROW(cordon::RunGhostFilter(*session), cordon::MissingDependencyException);
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kCleanTrips));
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kAuditLog));
}
