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


#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "config.h"
#include "runner.h"
#include "testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(pipeline_test_tmpdir, ".cordon_pipeline_test", "Local path for the test to create temporary files in.");

using cordon::FileSystem;
using cordon::FleetType;
using cordon::test_helpers::ScopedTestSession;
using cordon::test_helpers::TripSourceCSVHeader;

TEST(Pipeline, ParsesYearsAndMonths) {
  int year = 0;
  int month = 0;
  cordon::ParseYearMonth("2025-12", year, month);
  EXPECT_EQ(2025, year);
  EXPECT_EQ(12, month);
  ASSERT_THROW(cordon::ParseYearMonth("2025-13", year, month), cordon::ConfigException);
  ASSERT_THROW(cordon::ParseYearMonth("2025-1", year, month), cordon::ConfigException);
  ASSERT_THROW(cordon::ParseYearMonth("December", year, month), cordon::ConfigException);

  EXPECT_EQ(std::vector<int>({2024, 2025}), cordon::ParseYearList("2024,2025"));
  EXPECT_EQ(std::vector<int>({2025}), cordon::ParseYearList("2025"));
  ASSERT_THROW(cordon::ParseYearList("2024,next"), cordon::ConfigException);
}

namespace pipeline_test {

inline void PublishSources(const ScopedTestSession& session) {
  session.AddMirrorFile(cordon::kZoneLookupFileName,
                        "\"LocationID\",\"Borough\",\"Zone\",\"service_zone\"\n"
                        "41,\"Manhattan\",\"Central Harlem\",\"Boro Zone\"\n"
                        "74,\"Manhattan\",\"East Harlem North\",\"Boro Zone\"\n"
                        "161,\"Manhattan\",\"Midtown Center\",\"Yellow Zone\"\n"
                        "236,\"Manhattan\",\"Upper East Side North\",\"Yellow Zone\"\n"
                        "7,\"Queens\",\"Astoria\",\"Boro Zone\"\n");
  session.AddMirrorFile(cordon::WeatherRequest().FileName(),
                        "{\"daily\":{\"time\":[\"2024-01-02\",\"2025-01-02\"],\"precipitation_sum\":[5.0,0.0]}}");
  for (const FleetType fleet : cordon::kAllFleets) {
    session.AddMirrorFile(cordon::TripFileName(fleet, 2023, 12),
                          TripSourceCSVHeader(fleet) +
                              "2023-12-01 10:00:00,2023-12-01 10:20:00,74,161,2,15,2,20,2.5\n");
    session.AddMirrorFile(cordon::TripFileName(fleet, 2024, 12),
                          TripSourceCSVHeader(fleet) +
                              "2024-12-01 10:00:00,2024-12-01 10:20:00,74,161,2,15,2,20,2.5\n"
                              "2024-12-02 10:00:00,2024-12-02 10:20:00,7,161,3,18,0,22,\n");
  }
  session.AddMirrorFile("yellow_tripdata_2024-01.csv",
                        TripSourceCSVHeader(FleetType::Yellow) +
                            "2024-01-02 08:00:00,2024-01-02 08:30:00,74,161,3,20,4,28,2.5\n"
                            "2024-01-02 09:00:00,2024-01-02 09:15:00,7,236,2,15,0,18,0\n"
                            "2024-01-02 10:00:00,2024-01-02 10:00:20,161,41,0.2,30,0,32,\n"
                            "2024-01-02 11:00:00,2024-01-02 11:30:00,161,41,4,20,2,25,2.5\n");
  session.AddMirrorFile("green_tripdata_2025-01.csv",
                        TripSourceCSVHeader(FleetType::Green) +
                            "2025-01-02 08:00:00,2025-01-02 08:30:00,74,161,3,20,4,28,\n"
                            "2025-01-02 11:00:00,2025-01-02 11:30:00,236,41,4,20,2,25,2.5\n"
                            "2025-01-02 12:00:00,2025-01-02 12:30:00,236,41,4,20,2,25,2.5\n");
}

inline std::map<std::string, std::string> ReadAllTables(const std::string& dir) {
  std::map<std::string, std::string> tables;
  for (const std::string& name : FileSystem::ListFilesSorted(dir)) {
    tables[name] = FileSystem::ReadFileAsString(FileSystem::JoinPath(dir, name));
  }
  return tables;
}

}  // namespace pipeline_test

TEST(Pipeline, EndToEndAndIdempotent) {
  cordon::PipelineConfig config;
  config.ingest_years = {2024, 2025};
  const ScopedTestSession session(FLAGS_pipeline_test_tmpdir, config);
  pipeline_test::PublishSources(session);

  std::ostringstream log;
  {
    const cordon::ScopedLogToStream scope(log);
    cordon::RunPipeline(*session);
  }
  EXPECT_NE(std::string::npos, log.str().find("Stage 'fetch' started."));
  EXPECT_NE(std::string::npos, log.str().find("Stage 'aggregate' completed in "));

  const auto imputed = session->Output().Read<cordon::ImputedDecember>(cordon::tables::kImputedDecember);
  ASSERT_EQ(1u, imputed.size());
  // 0.3 * 2 + 0.7 * 4.
  EXPECT_DOUBLE_EQ(3.4, imputed[0].trips);

  // Both fleets of 2023-12 and 2024-12, fetched for the imputation, and the two January files.
  EXPECT_EQ(13u, session->Output().Read<cordon::TripRecord>(cordon::tables::kUnifiedTrips).size());
  const auto clean = session->Output().Read<cordon::TripWithMetrics>(cordon::tables::kCleanTrips);
  const auto ghosts = session->Output().Read<cordon::TripWithMetrics>(cordon::tables::kAuditLog);
  EXPECT_EQ(12u, clean.size());
  ASSERT_EQ(1u, ghosts.size());
  EXPECT_EQ("2024-01-02 10:00:00", cordon::FormatDateTime(cordon::Value(ghosts[0].pickup_time)));

  const auto compliance = session->Output().Read<cordon::ComplianceStats>(cordon::tables::kComplianceStats);
  ASSERT_EQ(1u, compliance.size());
  // Two per 2024-12 file, two in 2024-01, one in 2025-01. 2023-12 predates the policy.
  EXPECT_EQ(7, compliance[0].total_entering);
  EXPECT_EQ(3, compliance[0].compliant_trips);
  EXPECT_EQ(4u, session->Output().Read<cordon::TripWithMetrics>(cordon::tables::kLeakageTrips).size());

  const auto border = session->Output().Read<cordon::BorderEffect>(cordon::tables::kBorderEffect);
  ASSERT_EQ(1u, border.size());
  EXPECT_EQ(41, border[0].dropoff_loc);
  EXPECT_EQ(1, border[0].trips_before);
  EXPECT_EQ(2, border[0].trips_after);
  EXPECT_DOUBLE_EQ(100.0, cordon::Value(border[0].percent_change));

  int64_t monthly_total = 0;
  for (const cordon::MonthlyKPI& kpi : session->Output().Read<cordon::MonthlyKPI>(cordon::tables::kMonthlyKPIs)) {
    monthly_total += kpi.total_trips;
  }
  EXPECT_EQ(static_cast<int64_t>(clean.size()), monthly_total);

  const std::map<std::string, std::string> first_run = pipeline_test::ReadAllTables(session.OutputDir());
  EXPECT_EQ(17u, first_run.size());
  cordon::RunPipeline(*session);
  EXPECT_EQ(first_run, pipeline_test::ReadAllTables(session.OutputDir()));
}

TEST(Pipeline, SingleStage) {
  const ScopedTestSession session(FLAGS_pipeline_test_tmpdir);
  pipeline_test::PublishSources(session);
  cordon::RunPipeline(*session, "zones");
  EXPECT_TRUE(session->Output().Exists(cordon::tables::kCongestionZone));
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kUnifiedTrips));

  ASSERT_THROW(cordon::RunPipeline(*session, "everything"), cordon::ConfigException);
}

TEST(Pipeline, StopsAtTheFirstFailedStage) {
  const ScopedTestSession session(FLAGS_pipeline_test_tmpdir);
  std::ostringstream log;
  {
    const cordon::ScopedLogToStream scope(log);
    ASSERT_THROW(cordon::RunPipeline(*session, "ghost"), cordon::MissingDependencyException);
  }
  EXPECT_NE(std::string::npos, log.str().find("Stage 'ghost' failed: "));
  EXPECT_EQ(std::string::npos, log.str().find("Stage 'ghost' completed"));
  EXPECT_FALSE(session->Output().Exists(cordon::tables::kCleanTrips));
}
