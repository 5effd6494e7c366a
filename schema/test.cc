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

#include "source.h"
#include "tables.h"

#include "../bricks/file/file.h"
#include "../storage/table.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(schema_test_tmpdir, ".cordon_schema_test", "Local path for the test to create temporary files in.");

using cordon::FileSystem;
using cordon::FleetType;
using cordon::TripFilePeriod;
using cordon::TripRecord;

TEST(Schema, TripFileNames) {
  EXPECT_EQ("yellow_tripdata_2024-01.csv", cordon::TripFileName(FleetType::Yellow, 2024, 1));
  EXPECT_EQ("green_tripdata_2025-12.csv", cordon::TripFileName(FleetType::Green, 2025, 12));

  TripFilePeriod period;
  ASSERT_TRUE(cordon::ParseTripFileName("green_tripdata_2023-12.csv", period));
  EXPECT_TRUE(period.fleet == FleetType::Green);
  EXPECT_EQ(2023, period.year);
  EXPECT_EQ(12, period.month);

  EXPECT_FALSE(cordon::ParseTripFileName("fhv_tripdata_2023-12.csv", period));
  EXPECT_FALSE(cordon::ParseTripFileName("green_tripdata_2023-13.csv", period));
  EXPECT_FALSE(cordon::ParseTripFileName("green_tripdata_2023-12.parquet", period));
  EXPECT_FALSE(cordon::ParseTripFileName("green_tripdata_2023-12.csv.tmp", period));
  EXPECT_FALSE(cordon::ParseTripFileName("yellow_tripdata_20x3-12.csv", period));
}

TEST(Schema, ReadsBothFleets) {
  const FileSystem::ScopedTmpDir dir(FLAGS_schema_test_tmpdir);
  const std::string yellow = FileSystem::JoinPath(dir.Path(), "yellow_tripdata_2024-01.csv");
  const std::string green = FileSystem::JoinPath(dir.Path(), "green_tripdata_2024-01.csv");
  FileSystem::WriteStringToFile(
      "VendorID,tpep_pickup_datetime,tpep_dropoff_datetime,passenger_count,trip_distance,PULocationID,DOLocationID,"
      "fare_amount,tip_amount,total_amount,congestion_surcharge\n"
      "2,2024-01-01 00:57:55,2024-01-01 01:17:43,1,1.72,186,79,17.7,0.0,22.7,2.5\n"
      "1,,2024-01-01 00:10:00,1,abc,161.0,,5,1,6,\n",
      yellow.c_str());
  FileSystem::WriteStringToFile(
      "lpep_pickup_datetime,lpep_dropoff_datetime,PULocationID,DOLocationID,trip_distance,fare_amount,tip_amount,"
      "total_amount,congestion_surcharge\n"
      "2024-01-15 08:00:00,2024-01-15 07:59:00,74,75,0,3.5,0,4.5,0\n",
      green.c_str());

  std::vector<TripRecord> trips;
  EXPECT_EQ(2u, cordon::ForEachSourceTrip(yellow, FleetType::Yellow, [&trips](TripRecord&& t) { trips.push_back(t); }));
  EXPECT_EQ(1u, cordon::ForEachSourceTrip(green, FleetType::Green, [&trips](TripRecord&& t) { trips.push_back(t); }));
  ASSERT_EQ(3u, trips.size());

  EXPECT_TRUE(trips[0].taxi_type == FleetType::Yellow);
  EXPECT_EQ("2024-01-01 00:57:55", cordon::FormatDateTime(cordon::Value(trips[0].pickup_time)));
  EXPECT_EQ(186, trips[0].pickup_loc);
  EXPECT_EQ(79, trips[0].dropoff_loc);
  EXPECT_EQ(1.72, trips[0].trip_distance);
  EXPECT_EQ(17.7, trips[0].fare);
  EXPECT_EQ(22.7, trips[0].total_amount);
  EXPECT_EQ(2.5, cordon::Value(trips[0].congestion_surcharge));

  EXPECT_FALSE(cordon::Exists(trips[1].pickup_time));
  EXPECT_TRUE(cordon::Exists(trips[1].dropoff_time));
  EXPECT_EQ(0.0, trips[1].trip_distance);
  EXPECT_EQ(161, trips[1].pickup_loc);
  EXPECT_EQ(0, trips[1].dropoff_loc);
  EXPECT_FALSE(cordon::Exists(trips[1].congestion_surcharge));

  EXPECT_TRUE(trips[2].taxi_type == FleetType::Green);
  EXPECT_EQ("2024-01-15 07:59:00", cordon::FormatDateTime(cordon::Value(trips[2].dropoff_time)));
  EXPECT_EQ(0.0, cordon::Value(trips[2].congestion_surcharge));
}

TEST(Schema, MissingColumnIsASourceFormatError) {
  const FileSystem::ScopedTmpDir dir(FLAGS_schema_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "green_tripdata_2024-01.csv");
  // A yellow header in a green file.
  FileSystem::WriteStringToFile(
      "tpep_pickup_datetime,tpep_dropoff_datetime,PULocationID,DOLocationID,trip_distance,fare_amount,tip_amount,"
      "total_amount,congestion_surcharge\n",
      fn.c_str());
  ASSERT_THROW(cordon::ForEachSourceTrip(fn, FleetType::Green, [](TripRecord&&) {}), cordon::SourceFormatException);

  FileSystem::WriteStringToFile("a,b\n1\n", fn.c_str());
  ASSERT_THROW(cordon::ForEachSourceTrip(fn, FleetType::Green, [](TripRecord&&) {}), cordon::SourceFormatException);

  ASSERT_THROW(cordon::ForEachSourceTrip(FileSystem::JoinPath(dir.Path(), "nope.csv"),
                                         FleetType::Green,
                                         [](TripRecord&&) {}),
               cordon::MissingDependencyException);
}

TEST(Schema, ZoneLookup) {
  const FileSystem::ScopedTmpDir dir(FLAGS_schema_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), cordon::kZoneLookupFileName);
  FileSystem::WriteStringToFile(
      "\"LocationID\",\"Borough\",\"Zone\",\"service_zone\"\n"
      "1,\"EWR\",\"Newark Airport\",\"EWR\"\n"
      "4,\"Manhattan\",\"Alphabet City\",\"Yellow Zone\"\n",
      fn.c_str());
  const std::vector<cordon::ZoneLookupEntry> zones = cordon::ReadZoneLookup(fn);
  ASSERT_EQ(2u, zones.size());
  EXPECT_EQ(4, zones[1].location_id);
  EXPECT_EQ("Manhattan", zones[1].borough);
  EXPECT_EQ("Alphabet City", zones[1].zone);
  EXPECT_EQ("Yellow Zone", zones[1].service_zone);

  FileSystem::WriteStringToFile("\"LocationID\",\"Zone\"\n1,\"Newark Airport\"\n", fn.c_str());
  ASSERT_THROW(cordon::ReadZoneLookup(fn), cordon::SourceFormatException);
}

TEST(Schema, TripsPersistWithFleetAndNulls) {
  const FileSystem::ScopedTmpDir dir(FLAGS_schema_test_tmpdir);
  const cordon::TableStore store(dir.Path());
  cordon::TripWithMetrics trip;
  trip.taxi_type = FleetType::Green;
  trip.pickup_time = cordon::ParseCivilDateTime("2024-02-01 10:00:00");
  trip.pickup_loc = 74;
  trip.dropoff_loc = 236;
  trip.fare = 9.5;
  trip.duration_minutes = 12.5;
  store.Write(cordon::tables::kCleanTrips, std::vector<cordon::TripWithMetrics>({trip}));

  EXPECT_EQ(
      "#table {\"name\":\"clean_trips\",\"columns\":[\"taxi_type\",\"pickup_time\",\"dropoff_time\",\"pickup_loc\","
      "\"dropoff_loc\",\"trip_distance\",\"fare\",\"tip_amount\",\"total_amount\",\"congestion_surcharge\","
      "\"duration_minutes\",\"avg_speed_mph\"]}\n"
      "{\"taxi_type\":\"Green\",\"pickup_time\":\"2024-02-01 10:00:00\",\"dropoff_time\":null,\"pickup_loc\":74,"
      "\"dropoff_loc\":236,\"trip_distance\":0.0,\"fare\":9.5,\"tip_amount\":0.0,\"total_amount\":0.0,"
      "\"congestion_surcharge\":null,\"duration_minutes\":12.5,\"avg_speed_mph\":0.0}\n",
      FileSystem::ReadFileAsString(store.TablePath(cordon::tables::kCleanTrips)));

  const auto rows = store.Read<cordon::TripWithMetrics>(cordon::tables::kCleanTrips);
  ASSERT_EQ(1u, rows.size());
  EXPECT_TRUE(rows[0].taxi_type == FleetType::Green);
  EXPECT_EQ(12.5, rows[0].duration_minutes);

  // An unknown fleet is a malformed table.
  FileSystem::WriteStringToFile(
      "#table {\"name\":\"q1_yellow_green\",\"columns\":[\"taxi_type\",\"year\",\"trips\"]}\n"
      "{\"taxi_type\":\"FHV\",\"year\":2024,\"trips\":1}\n",
      store.TablePath(cordon::tables::kFleetDecline).c_str());
  ASSERT_THROW(store.Read<cordon::FleetQuarter>(cordon::tables::kFleetDecline), cordon::TableFormatException);
}
