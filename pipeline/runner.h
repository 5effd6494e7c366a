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


// The pipeline runner: every stage in dependency order, or one stage alone.
//
// A run either completes every stage or stops at the first failure, naming the failed stage in the log.

#ifndef CORDON_PIPELINE_RUNNER_H
#define CORDON_PIPELINE_RUNNER_H

#include "../port.h"

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "config.h"
#include "session.h"

#include "../aggregate/aggregate.h"
#include "../bricks/log/log.h"
#include "../bricks/strings/join.h"
#include "../bricks/strings/util.h"
#include "../bricks/time/chrono.h"
#include "../fetcher/ingest.h"
#include "../ghost/ghost.h"
#include "../impute/impute.h"
#include "../leakage/leakage.h"
#include "../unify/unify.h"
#include "../weather/weather.h"
#include "../zones/zones.h"

namespace cordon {

constexpr char kAllStages[] = "all";

struct Stage {
  std::string name;
  std::function<void(const Session&)> run;
};

inline std::vector<Stage> PipelineStages() {
  return {{"fetch", [](const Session& session) { RunIngestion(session); }},
          {"impute", [](const Session& session) { RunDecemberImputer(session); }},
          {"unify", [](const Session& session) { RunSchemaUnifier(session); }},
          {"ghost", [](const Session& session) { RunGhostFilter(session); }},
          {"zones", [](const Session& session) { RunZoneBuilder(session); }},
          {"leakage", [](const Session& session) { RunLeakageAuditor(session); }},
          {"weather", [](const Session& session) { RunWeatherCache(session); }},
          {"aggregate", [](const Session& session) { RunAggregations(session); }}};
}

inline void RunStage(const Session& session, const Stage& stage) {
  Log().Info("Stage '" + stage.name + "' started.");
  const std::chrono::microseconds begin = time::Now();
  try {
    stage.run(session);
  } catch (const std::exception& e) {
    Log().Error("Stage '" + stage.name + "' failed: " + e.what());
    throw;
  }
  const int64_t elapsed_ms = (time::Now() - begin).count() / 1000;
  Log().Info("Stage '" + stage.name + "' completed in " + strings::ToString(elapsed_ms) + " ms.");
}

// `stage` is either a stage name, or "all" for the whole pipeline.
inline void RunPipeline(const Session& session, const std::string& stage = kAllStages) {
  const std::vector<Stage> stages = PipelineStages();
  if (stage == kAllStages) {
    for (const Stage& s : stages) {
      RunStage(session, s);
    }
    return;
  }
  std::vector<std::string> names;
  for (const Stage& s : stages) {
    if (s.name == stage) {
      RunStage(session, s);
      return;
    }
    names.push_back(s.name);
  }
  CORDON_THROW(ConfigException("Unknown stage `" + stage + "`, expected `" + kAllStages + "` or one of " +
                               strings::Join(names, ", ") + '.'));
}

}  // namespace cordon

#endif  // CORDON_PIPELINE_RUNNER_H
