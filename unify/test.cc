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

#include "unify.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(unify_test_tmpdir, ".cordon_unify_test", "Local path for the test to create temporary files in.");

using cordon::FleetType;
using cordon::TripRecord;
using cordon::test_helpers::ScopedTestSession;
using cordon::test_helpers::TripSourceCSVHeader;

TEST(Unify, YellowThenGreenInFileNameOrder) {
  const ScopedTestSession session(FLAGS_unify_test_tmpdir);
  session.AddDataFile("green_tripdata_2024-01.csv",
                      TripSourceCSVHeader(FleetType::Green) +
                          "2024-01-05 10:00:00,2024-01-05 10:20:00,74,75,3,15,2,20,0\n");
  session.AddDataFile("yellow_tripdata_2024-02.csv",
                      TripSourceCSVHeader(FleetType::Yellow) +
                          "2024-02-01 08:00:00,2024-02-01 08:30:00,1,2,5,25,5,33,2.5\n");
  session.AddDataFile("yellow_tripdata_2024-01.csv",
                      TripSourceCSVHeader(FleetType::Yellow) +
                          "2024-01-01 09:00:00,2024-01-01 09:15:00,3,4,1,10,0,12,\n"
                          "2022-12-31 23:00:00,2022-12-31 23:10:00,5,6,0,0,0,0,\n");
  // Neither is a raw trip file.
  session.AddDataFile("taxi_zone_lookup.csv", "LocationID,Borough,Zone,service_zone\n");
  session.AddDataFile("fhv_tripdata_2024-01.csv", "x\n");

  EXPECT_EQ(4u, cordon::RunSchemaUnifier(*session));
  const auto trips = session->Output().Read<TripRecord>(cordon::tables::kUnifiedTrips);
  ASSERT_EQ(4u, trips.size());
  EXPECT_EQ(3, trips[0].pickup_loc);
  EXPECT_EQ(5, trips[1].pickup_loc);
  EXPECT_EQ("2022-12-31 23:00:00", cordon::FormatDateTime(cordon::Value(trips[1].pickup_time)));
  EXPECT_EQ(1, trips[2].pickup_loc);
  EXPECT_TRUE(trips[2].taxi_type == FleetType::Yellow);
  EXPECT_EQ(74, trips[3].pickup_loc);
  EXPECT_TRUE(trips[3].taxi_type == FleetType::Green);
  EXPECT_EQ(2.0, trips[3].tip_amount);
  EXPECT_EQ(0.0, cordon::Value(trips[3].congestion_surcharge));
  EXPECT_FALSE(cordon::Exists(trips[0].congestion_surcharge));
}

TEST(Unify, NoFilesGiveAnEmptyTable) {
  const ScopedTestSession session(FLAGS_unify_test_tmpdir);
  EXPECT_EQ(0u, cordon::RunSchemaUnifier(*session));
  EXPECT_TRUE(session->Output().Read<TripRecord>(cordon::tables::kUnifiedTrips).empty());
}

TEST(Unify, MissingColumnFailsTheStage) {
  const ScopedTestSession session(FLAGS_unify_test_tmpdir);
  session.AddDataFile("yellow_tripdata_2024-01.csv", "tpep_pickup_datetime,PULocationID\n2024-01-01 09:00:00,3\n");
  ASSERT_THROW(cordon::RunSchemaUnifier(*session), cordon::SourceFormatException);
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kUnifiedTrips));
}
