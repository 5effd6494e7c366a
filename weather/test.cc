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

#include "weather.h"

#include "../pipeline/testing.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(weather_test_tmpdir, ".cordon_weather_test", "Local path for the test to create temporary files in.");

using cordon::DailyWeather;
using cordon::SourceFormatException;
using cordon::test_helpers::ScopedTestSession;
using cordon::weather::ParseWeatherJSON;

TEST(Weather, ParsesTheDailySeries) {
  const std::vector<DailyWeather> days = ParseWeatherJSON(
      "{\"latitude\":40.78,\"daily_units\":{\"time\":\"iso8601\"},"
      "\"daily\":{\"time\":[\"2024-01-01\",\"2024-01-02\",\"2024-01-03\"],\"precipitation_sum\":[0.0,12.5,null]}}",
      "test");
  ASSERT_EQ(3u, days.size());
  EXPECT_EQ("2024-01-01", days[0].trip_date);
  EXPECT_EQ(0.0, cordon::Value(days[0].precipitation));
  EXPECT_EQ(12.5, cordon::Value(days[1].precipitation));
  EXPECT_EQ("2024-01-03", days[2].trip_date);
  EXPECT_FALSE(cordon::Exists(days[2].precipitation));
}

TEST(Weather, MalformedDocuments) {
  ASSERT_THROW(ParseWeatherJSON("", "test"), SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("[1,2]", "test"), SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("{\"hourly\":{}}", "test"), SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("{\"daily\":{\"time\":[\"2024-01-01\"]}}", "test"), SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("{\"daily\":{\"time\":[\"2024-01-01\"],\"precipitation_sum\":[]}}", "test"),
               SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("{\"daily\":{\"time\":[\"Monday\"],\"precipitation_sum\":[1.0]}}", "test"),
               SourceFormatException);
  ASSERT_THROW(ParseWeatherJSON("{\"daily\":{\"time\":[\"2024-01-01\"],\"precipitation_sum\":[\"wet\"]}}", "test"),
               SourceFormatException);
}

TEST(Weather, FetchesOnceThenReusesTheCache) {
  const ScopedTestSession session(FLAGS_weather_test_tmpdir);
  const cordon::WeatherRequest request;
  session.AddMirrorFile(request.FileName(),
                        "{\"daily\":{\"time\":[\"2024-01-01\",\"2024-01-02\"],\"precipitation_sum\":[0.0,3.1]}}");
  EXPECT_EQ(2u, cordon::RunWeatherCache(*session));
  const auto days = session->Data().Read<DailyWeather>(cordon::tables::kWeather);
  ASSERT_EQ(2u, days.size());
  EXPECT_EQ("2024-01-02", days[1].trip_date);
  EXPECT_EQ(3.1, cordon::Value(days[1].precipitation));
  EXPECT_EQ(
      "#table {\"name\":\"ny_weather\",\"columns\":[\"trip_date\",\"precipitation\"]}\n"
      "{\"trip_date\":\"2024-01-01\",\"precipitation\":0.0}\n"
      "{\"trip_date\":\"2024-01-02\",\"precipitation\":3.1}\n",
      cordon::FileSystem::ReadFileAsString(session->Data().TablePath(cordon::tables::kWeather)));

  // The cached table wins over a changed source.
  cordon::FileSystem::RmFile(cordon::FileSystem::JoinPath(session.DataDir(), request.FileName()));
  session.AddMirrorFile(request.FileName(), "not a JSON");
  EXPECT_EQ(2u, cordon::RunWeatherCache(*session));
}

TEST(Weather, UnavailableSeriesIsAMissingDependency) {
  const ScopedTestSession session(FLAGS_weather_test_tmpdir);
  ASSERT_THROW(cordon::RunWeatherCache(*session), cordon::MissingDependencyException);
}
