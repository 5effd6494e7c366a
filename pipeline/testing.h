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


// Scaffolding for the stage tests: a session over scratch directories, and concise trip builders.

#ifndef CORDON_PIPELINE_TESTING_H
#define CORDON_PIPELINE_TESTING_H

#include "../port.h"

#include <string>

#include "session.h"

#include "../bricks/file/file.h"
#include "../fetcher/fetcher.h"
#include "../schema/types.h"

namespace cordon {
namespace test_helpers {

class ScopedTestSession final {
 public:
  explicit ScopedTestSession(const std::string& base_dir, const PipelineConfig& config = PipelineConfig())
      : mirror_dir_(base_dir + "_mirror"),
        data_dir_(base_dir + "_data"),
        output_dir_(base_dir + "_output"),
        config_(WithDirs(config)),
        fetcher_(mirror_dir_.Path(), data_dir_.Path()),
        session_(config_, fetcher_) {}

  const Session& operator*() const { return session_; }
  const Session* operator->() const { return &session_; }

  const std::string& MirrorDir() const { return mirror_dir_.Path(); }
  const std::string& DataDir() const { return data_dir_.Path(); }
  const std::string& OutputDir() const { return output_dir_.Path(); }

  void AddMirrorFile(const std::string& name, const std::string& contents) const {
    FileSystem::WriteStringToFile(contents, FileSystem::JoinPath(mirror_dir_.Path(), name).c_str());
  }
  void AddDataFile(const std::string& name, const std::string& contents) const {
    FileSystem::WriteStringToFile(contents, FileSystem::JoinPath(data_dir_.Path(), name).c_str());
  }

 private:
  PipelineConfig WithDirs(PipelineConfig config) const {
    config.source_mirror_dir = mirror_dir_.Path();
    config.data_dir = data_dir_.Path();
    config.output_dir = output_dir_.Path();
    return config;
  }

  const FileSystem::ScopedTmpDir mirror_dir_;
  const FileSystem::ScopedTmpDir data_dir_;
  const FileSystem::ScopedTmpDir output_dir_;
  const PipelineConfig config_;
  LocalMirrorFetcher fetcher_;
  const Session session_;
};

inline TripWithMetrics MakeTrip(FleetType fleet,
                                const std::string& pickup,
                                const std::string& dropoff,
                                int32_t pickup_loc,
                                int32_t dropoff_loc) {
  TripWithMetrics trip;
  trip.taxi_type = fleet;
  trip.pickup_time = ParseCivilDateTime(pickup);
  trip.dropoff_time = ParseCivilDateTime(dropoff);
  trip.pickup_loc = pickup_loc;
  trip.dropoff_loc = dropoff_loc;
  return trip;
}

// The header of a raw trip file of the given fleet, limited to the columns the pipeline reads.
inline std::string TripSourceCSVHeader(FleetType fleet) {
  const std::string prefix = fleet == FleetType::Yellow ? "tpep" : "lpep";
  return prefix + "_pickup_datetime," + prefix +
         "_dropoff_datetime,PULocationID,DOLocationID,trip_distance,fare_amount,tip_amount,total_amount,"
         "congestion_surcharge\n";
}

}  // namespace test_helpers
}  // namespace cordon

#endif  // CORDON_PIPELINE_TESTING_H
