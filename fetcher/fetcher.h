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


// The source fetcher: turns a request for a raw artifact into the path of a complete local copy of it.
//
// Every fetch is idempotent. An artifact already present in the data directory is returned as is.

#ifndef CORDON_FETCHER_FETCHER_H
#define CORDON_FETCHER_FETCHER_H

#include "../port.h"

#include <string>

#include "exceptions.h"

#include "../bricks/file/file.h"
#include "../bricks/strings/printf.h"
#include "../schema/source.h"
#include "../schema/types.h"

namespace cordon {

// The daily weather series for one geographic point, in the Open-Meteo archive format:
// `{"daily":{"time":["2024-01-01",...],"precipitation_sum":[0.0,...]}}`.
struct WeatherRequest {
  // Central Park.
  double latitude = 40.7812;
  double longitude = -73.9665;
  std::string start_date = "2024-01-01";
  std::string end_date = "2025-12-31";
  std::string daily = "precipitation_sum";
  std::string timezone = "America/New_York";

  std::string FileName() const {
    return strings::Printf(
        "weather_%.4f_%.4f_%s_%s.json", latitude, longitude, start_date.c_str(), end_date.c_str());
  }

  // The query of the archive API, `https://archive-api.open-meteo.com/v1/archive?<query>`.
  std::string QueryString() const {
    return strings::Printf("latitude=%.4f&longitude=%.4f&start_date=%s&end_date=%s&daily=%s&timezone=%s",
                           latitude,
                           longitude,
                           start_date.c_str(),
                           end_date.c_str(),
                           daily.c_str(),
                           timezone.c_str());
  }
};

class SourceFetcher {
 public:
  virtual ~SourceFetcher() = default;

  // Throws `SourceNotPublishedException` if the source does not offer this period,
  // and `FetchFailureException` on any storage or network error.
  virtual std::string FetchTripFile(FleetType fleet, int year, int month) = 0;
  virtual std::string FetchZoneLookup() = 0;
  virtual std::string FetchWeather(const WeatherRequest& request) = 0;
};

// Resolves artifacts from a local mirror of the source, by file name, copying them into the data directory.
// The copy goes through a temporary file, so a partially copied file never appears under its final name.
class LocalMirrorFetcher final : public SourceFetcher {
 public:
  LocalMirrorFetcher(const std::string& mirror_dir, const std::string& data_dir)
      : mirror_dir_(mirror_dir), data_dir_(data_dir) {}

  std::string FetchTripFile(FleetType fleet, int year, int month) override {
    return Fetch(TripFileName(fleet, year, month));
  }

  std::string FetchZoneLookup() override { return Fetch(kZoneLookupFileName); }

  std::string FetchWeather(const WeatherRequest& request) override { return Fetch(request.FileName()); }

 private:
  std::string Fetch(const std::string& name) const {
    const std::string destination = FileSystem::JoinPath(data_dir_, name);
    if (FileSystem::Exists(destination)) {
      return destination;
    }
    if (mirror_dir_.empty()) {
      CORDON_THROW(SourceNotPublishedException(name));
    }
    const std::string origin = FileSystem::JoinPath(mirror_dir_, name);
    if (!FileSystem::Exists(origin)) {
      CORDON_THROW(SourceNotPublishedException(name));
    }
    try {
      FileSystem::WriteStringToFileAtomically(FileSystem::ReadFileAsString(origin), destination);
    } catch (const FileException& e) {
      CORDON_THROW(FetchFailureException("Could not copy `" + origin + "` into `" + destination + "`: " +
                                         e.OriginalDescription()));
    }
    return destination;
  }

  const std::string mirror_dir_;
  const std::string data_dir_;
};

}  // namespace cordon

#endif  // CORDON_FETCHER_FETCHER_H
