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


#include <string>
#include <vector>

#include "leakage.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(leakage_test_tmpdir, ".cordon_leakage_test", "Local path for the test to create temporary files in.");

using cordon::FleetType;
using cordon::LeakagePickup;
using cordon::TripWithMetrics;
using cordon::ZoneSet;
using cordon::test_helpers::MakeTrip;
using cordon::test_helpers::ScopedTestSession;

namespace leakage_test {

inline TripWithMetrics Entering(const std::string& pickup, int32_t from, int32_t to, cordon::Optional<double> surcharge) {
  TripWithMetrics trip = MakeTrip(FleetType::Yellow, pickup, pickup, from, to);
  trip.congestion_surcharge = surcharge;
  trip.total_amount = 10.0;
  return trip;
}

}  // namespace leakage_test

TEST(Leakage, EnteringTrips) {
  const ZoneSet zone({161, 236});
  EXPECT_TRUE(cordon::leakage::IsEnteringTrip(leakage_test::Entering("2024-01-01 00:00:00", 74, 161, 2.5), zone));
  EXPECT_FALSE(cordon::leakage::IsEnteringTrip(leakage_test::Entering("2024-01-01 00:00:00", 161, 236, 2.5), zone));
  EXPECT_FALSE(cordon::leakage::IsEnteringTrip(leakage_test::Entering("2024-01-01 00:00:00", 161, 74, 2.5), zone));
  EXPECT_FALSE(cordon::leakage::IsEnteringTrip(leakage_test::Entering("2024-01-01 00:00:00", 74, 75, 2.5), zone));
}

TEST(Leakage, TopPickupZonesKeepTheFirstAppearanceOrderOnTies) {
  cordon::leakage::PickupZoneCounter counter;
  EXPECT_TRUE(counter.Top(3u).empty());
  for (const int32_t zone : {7, 42, 42, 13, 7, 99, 13, 5}) {
    counter.Add(zone);
  }
  const std::vector<LeakagePickup> top = counter.Top(3u);
  ASSERT_EQ(3u, top.size());
  EXPECT_EQ(7, top[0].pickup_loc);
  EXPECT_EQ(2, top[0].leakage_count);
  EXPECT_EQ(42, top[1].pickup_loc);
  EXPECT_EQ(13, top[2].pickup_loc);
  EXPECT_EQ(5u, counter.Top(10u).size());
}

TEST(Leakage, Audit) {
  const ScopedTestSession session(FLAGS_leakage_test_tmpdir);
  session->Output().Write(cordon::tables::kCongestionZone,
                          std::vector<cordon::ZoneId>({cordon::ZoneId(161), cordon::ZoneId(236)}));
  std::vector<TripWithMetrics> clean;
  clean.push_back(leakage_test::Entering("2024-02-01 10:00:00", 74, 161, 2.5));
  clean.push_back(leakage_test::Entering("2024-02-01 11:00:00", 74, 236, nullptr));
  clean.push_back(leakage_test::Entering("2024-03-01 12:00:00", 75, 161, 0.0));
  // Before the policy went live.
  clean.push_back(leakage_test::Entering("2023-12-31 23:59:59", 74, 161, nullptr));
  // Inside the zone all along.
  clean.push_back(leakage_test::Entering("2024-02-01 10:00:00", 161, 236, nullptr));
  clean.push_back(leakage_test::Entering("2025-01-05 17:30:00", 75, 161, -2.5));
  session->Output().Write(cordon::tables::kCleanTrips, clean);

  const cordon::ComplianceStats stats = cordon::RunLeakageAuditor(*session);
  EXPECT_EQ(4, stats.total_entering);
  EXPECT_EQ(1, stats.compliant_trips);

  const auto persisted = session->Output().Read<cordon::ComplianceStats>(cordon::tables::kComplianceStats);
  ASSERT_EQ(1u, persisted.size());
  EXPECT_EQ(4, persisted[0].total_entering);
  EXPECT_EQ(1, persisted[0].compliant_trips);

  const auto leakage = session->Output().Read<TripWithMetrics>(cordon::tables::kLeakageTrips);
  ASSERT_EQ(3u, leakage.size());
  EXPECT_EQ("2024-02-01 11:00:00", cordon::FormatDateTime(cordon::Value(leakage[0].pickup_time)));
  EXPECT_EQ("2024-03-01 12:00:00", cordon::FormatDateTime(cordon::Value(leakage[1].pickup_time)));
  EXPECT_EQ("2025-01-05 17:30:00", cordon::FormatDateTime(cordon::Value(leakage[2].pickup_time)));
  for (const TripWithMetrics& trip : leakage) {
    EXPECT_FALSE(cordon::leakage::PaidSurcharge(trip));
  }

  const auto top = session->Output().Read<LeakagePickup>(cordon::tables::kTopLeakagePickups);
  ASSERT_EQ(2u, top.size());
  EXPECT_EQ(75, top[0].pickup_loc);
  EXPECT_EQ(2, top[0].leakage_count);
  EXPECT_EQ(74, top[1].pickup_loc);
  EXPECT_EQ(1, top[1].leakage_count);
}

TEST(Leakage, RequiresTheCongestionZone) {
  const ScopedTestSession session(FLAGS_leakage_test_tmpdir);
  session->Output().Write(cordon::tables::kCleanTrips, std::vector<TripWithMetrics>());
  ASSERT_THROW(cordon::RunLeakageAuditor(*session), cordon::MissingTableException);
}
