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


// The weather cache: the daily precipitation series, fetched once and kept as the `ny_weather` table
// in the data directory.

#ifndef CORDON_WEATHER_WEATHER_H
#define CORDON_WEATHER_WEATHER_H

#include "../port.h"

#include <chrono>
#include <string>
#include <vector>

#include "../bricks/file/file.h"
#include "../bricks/log/log.h"
#include "../bricks/strings/util.h"
#include "../bricks/time/chrono.h"
#include "../fetcher/fetcher.h"
#include "../pipeline/session.h"
#include "../schema/exceptions.h"
#include "../schema/tables.h"
#include "../storage/exceptions.h"
#include "../storage/rapidjson.h"

namespace cordon {
namespace weather {

// `{"daily":{"time":["2024-01-01",...],"precipitation_sum":[0.0,...]}}`. A `null` precipitation is kept as such.
inline std::vector<DailyWeather> ParseWeatherJSON(const std::string& json, const std::string& source_name) {
  rapidjson::Document document;
  if (document.Parse(json.c_str()).HasParseError() || !document.IsObject()) {
    CORDON_THROW(SourceFormatException("The weather document `" + source_name + "` is not a valid JSON object."));
  }
  const auto daily = document.FindMember("daily");
  if (daily == document.MemberEnd() || !daily->value.IsObject()) {
    CORDON_THROW(SourceFormatException("The weather document `" + source_name + "` has no `daily` object."));
  }
  const auto dates = daily->value.FindMember("time");
  const auto precipitation = daily->value.FindMember("precipitation_sum");
  if (dates == daily->value.MemberEnd() || !dates->value.IsArray() || precipitation == daily->value.MemberEnd() ||
      !precipitation->value.IsArray()) {
    CORDON_THROW(SourceFormatException("The weather document `" + source_name +
                                       "` lacks the `daily.time` or the `daily.precipitation_sum` array."));
  }
  if (dates->value.Size() != precipitation->value.Size()) {
    CORDON_THROW(SourceFormatException("The weather document `" + source_name + "` has " +
                                       strings::ToString(dates->value.Size()) + " days, but " +
                                       strings::ToString(precipitation->value.Size()) + " precipitation values."));
  }
  std::vector<DailyWeather> result;
  for (rapidjson::SizeType i = 0; i < dates->value.Size(); ++i) {
    const rapidjson::Value& date = dates->value[i];
    const rapidjson::Value& value = precipitation->value[i];
    const Optional<std::chrono::microseconds> midnight =
        date.IsString() ? ParseCivilDate(date.GetString()) : Optional<std::chrono::microseconds>();
    if (!Exists(midnight)) {
      CORDON_THROW(SourceFormatException("The weather document `" + source_name + "` has a malformed date at index " +
                                         strings::ToString(i) + '.'));
    }
    DailyWeather day;
    // Normalized, to match the pickup dates of the trips exactly.
    day.trip_date = FormatDate(Value(midnight));
    if (value.IsNumber()) {
      day.precipitation = value.GetDouble();
    } else if (!value.IsNull()) {
      CORDON_THROW(SourceFormatException("The weather document `" + source_name +
                                         "` has a non-numeric precipitation at index " + strings::ToString(i) + '.'));
    }
    result.push_back(day);
  }
  return result;
}

}  // namespace weather

// Returns the number of days in the cached series.
inline size_t RunWeatherCache(const Session& session) {
  if (session.Data().Exists(tables::kWeather)) {
    const size_t days = session.Data().Read<DailyWeather>(tables::kWeather).size();
    Log().Info("Reusing the cached weather, " + strings::ToString(days) + " days.");
    return days;
  }
  const WeatherRequest& request = session.Config().weather;
  std::string file_name;
  try {
    file_name = session.Fetcher().FetchWeather(request);
  } catch (const SourceNotPublishedException& e) {
    CORDON_THROW(MissingDependencyException("The weather series is required: " + e.OriginalDescription()));
  }
  const std::vector<DailyWeather> days =
      weather::ParseWeatherJSON(FileSystem::ReadFileAsString(file_name), request.FileName());
  session.Data().Write(tables::kWeather, days);
  Log().Info("Cached the weather from " + request.start_date + " to " + request.end_date + ", " +
             strings::ToString(days.size()) + " days.");
  return days.size();
}

}  // namespace cordon

#endif  // CORDON_WEATHER_WEATHER_H
