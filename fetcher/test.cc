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


#include <set>
#include <string>
#include <vector>

#include "fetcher.h"
#include "ingest.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(fetcher_test_tmpdir, ".cordon_fetcher_test", "Local path for the test to create temporary files in.");

using cordon::FileSystem;
using cordon::FleetType;
using cordon::LocalMirrorFetcher;

TEST(Fetcher, WeatherRequest) {
  const cordon::WeatherRequest request;
  EXPECT_EQ("weather_40.7812_-73.9665_2024-01-01_2025-12-31.json", request.FileName());
  EXPECT_EQ(
      "latitude=40.7812&longitude=-73.9665&start_date=2024-01-01&end_date=2025-12-31&daily=precipitation_sum&"
      "timezone=America/New_York",
      request.QueryString());
}

TEST(Fetcher, LocalMirrorCopiesOnceAndReportsUnpublishedPeriods) {
  const FileSystem::ScopedTmpDir mirror(FLAGS_fetcher_test_tmpdir + "_mirror");
  const FileSystem::ScopedTmpDir data(FLAGS_fetcher_test_tmpdir + "_data");
  FileSystem::WriteStringToFile("header\n", FileSystem::JoinPath(mirror.Path(), "yellow_tripdata_2024-12.csv").c_str());
  FileSystem::WriteStringToFile("zones\n", FileSystem::JoinPath(mirror.Path(), "taxi_zone_lookup.csv").c_str());

  LocalMirrorFetcher fetcher(mirror.Path(), data.Path());
  const std::string path = fetcher.FetchTripFile(FleetType::Yellow, 2024, 12);
  EXPECT_EQ(FileSystem::JoinPath(data.Path(), "yellow_tripdata_2024-12.csv"), path);
  EXPECT_EQ("header\n", FileSystem::ReadFileAsString(path));
  EXPECT_FALSE(FileSystem::Exists(path + ".tmp"));

  // Idempotent: the local copy is not refreshed.
  FileSystem::WriteStringToFile("changed\n", FileSystem::JoinPath(mirror.Path(), "yellow_tripdata_2024-12.csv").c_str());
  EXPECT_EQ(path, fetcher.FetchTripFile(FleetType::Yellow, 2024, 12));
  EXPECT_EQ("header\n", FileSystem::ReadFileAsString(path));

  EXPECT_EQ("zones\n", FileSystem::ReadFileAsString(fetcher.FetchZoneLookup()));

  ASSERT_THROW(fetcher.FetchTripFile(FleetType::Green, 2024, 12), cordon::SourceNotPublishedException);
  ASSERT_THROW(fetcher.FetchWeather(cordon::WeatherRequest()), cordon::SourceNotPublishedException);
}

TEST(Fetcher, NoMirrorServesOnlyLocalFiles) {
  const FileSystem::ScopedTmpDir data(FLAGS_fetcher_test_tmpdir + "_data");
  FileSystem::WriteStringToFile("", FileSystem::JoinPath(data.Path(), "green_tripdata_2025-01.csv").c_str());
  LocalMirrorFetcher fetcher("", data.Path());
  EXPECT_EQ(FileSystem::JoinPath(data.Path(), "green_tripdata_2025-01.csv"),
            fetcher.FetchTripFile(FleetType::Green, 2025, 1));
  ASSERT_THROW(fetcher.FetchTripFile(FleetType::Green, 2025, 2), cordon::SourceNotPublishedException);
}

namespace fetcher_test {

struct RecordingFetcher : cordon::SourceFetcher {
  std::set<std::string> published;
  std::vector<std::string> requested;
  bool fail = false;

  std::string FetchTripFile(FleetType fleet, int year, int month) override {
    const std::string name = cordon::TripFileName(fleet, year, month);
    requested.push_back(name);
    if (fail) {
      CORDON_THROW(cordon::FetchFailureException("Network is down."));
    }
    if (!published.count(name)) {
      CORDON_THROW(cordon::SourceNotPublishedException(name));
    }
    return name;
  }
  std::string FetchZoneLookup() override { return cordon::kZoneLookupFileName; }
  std::string FetchWeather(const cordon::WeatherRequest& request) override { return request.FileName(); }
};

}  // namespace fetcher_test

TEST(Fetcher, IngestionSkipsUnpublishedMonths) {
  const FileSystem::ScopedTmpDir data(FLAGS_fetcher_test_tmpdir + "_data");
  const FileSystem::ScopedTmpDir output(FLAGS_fetcher_test_tmpdir + "_output");
  cordon::PipelineConfig config;
  config.data_dir = data.Path();
  config.output_dir = output.Path();
  config.ingest_years = {2024, 2025};

  fetcher_test::RecordingFetcher fetcher;
  fetcher.published = {"yellow_tripdata_2024-01.csv", "green_tripdata_2025-11.csv"};
  const cordon::Session session(config, fetcher);
  const cordon::IngestionSummary summary = cordon::RunIngestion(session);
  EXPECT_EQ(2u, summary.available);
  EXPECT_EQ(46u, summary.not_published);
  ASSERT_EQ(48u, fetcher.requested.size());
  EXPECT_EQ("yellow_tripdata_2024-01.csv", fetcher.requested[0]);
  EXPECT_EQ("green_tripdata_2024-01.csv", fetcher.requested[1]);
  EXPECT_EQ("green_tripdata_2025-12.csv", fetcher.requested.back());

  fetcher.fail = true;
  ASSERT_THROW(cordon::RunIngestion(session), cordon::FetchFailureException);
}
