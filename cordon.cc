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


// The `cordon` binary: runs the congestion-zone audit pipeline, or one of its stages.
//
//   ./cordon --source_mirror_dir=mirror --ingest_years=2024,2025
//   ./cordon --stage=aggregate --parallel_aggregations=false

#include <string>

#include "pipeline/config.h"
#include "pipeline/runner.h"
#include "pipeline/session.h"

#include "bricks/dflags/dflags.h"
#include "bricks/log/log.h"

DEFINE_string(data_dir, "data", "The directory of the raw source files and the weather cache.");
DEFINE_string(output_dir, "output", "The directory of the pipeline tables.");
DEFINE_string(source_mirror_dir, "", "A local mirror of the trip record source. Empty to use only `--data_dir`.");
DEFINE_string(ingest_years, "2025", "The comma-separated years to ingest the trip files of.");
DEFINE_string(december_target, "2025-12", "The most recent required month, as `YYYY-MM`, imputed if unpublished.");
DEFINE_int32(quality_cutoff_year, 2023, "Trips picked up before this year are discarded as stale.");
DEFINE_int32(policy_cutoff_year, 2024, "The year the congestion surcharge went live.");
DEFINE_int32(comparison_year_before, 2024, "The baseline year of the before/after comparisons.");
DEFINE_int32(comparison_year_after, 2025, "The compared year of the before/after comparisons.");
DEFINE_bool(parallel_aggregations, true, "Run the aggregation passes concurrently, one thread each.");
DEFINE_string(stage, "all", "The stage to run: `all`, or one of fetch, impute, unify, ghost, zones, leakage, "
                            "weather, aggregate.");
DEFINE_bool(log_to_stderr, true, "Log the progress of the run to stderr.");

int main(int argc, char** argv) {
  ParseDFlags(&argc, &argv);

  if (FLAGS_log_to_stderr) {
    cordon::Log().LogToStderr();
  }

  try {
    cordon::PipelineConfig config;
    config.data_dir = FLAGS_data_dir;
    config.output_dir = FLAGS_output_dir;
    config.source_mirror_dir = FLAGS_source_mirror_dir;
    config.ingest_years = cordon::ParseYearList(FLAGS_ingest_years);
    cordon::ParseYearMonth(FLAGS_december_target, config.december_target_year, config.december_target_month);
    config.quality_cutoff_year = FLAGS_quality_cutoff_year;
    config.policy_cutoff_year = FLAGS_policy_cutoff_year;
    config.comparison_year_before = FLAGS_comparison_year_before;
    config.comparison_year_after = FLAGS_comparison_year_after;
    config.parallel_aggregations = FLAGS_parallel_aggregations;

    cordon::LocalMirrorFetcher fetcher(config.source_mirror_dir, config.data_dir);
    const cordon::Session session(config, fetcher);
    cordon::RunPipeline(session, FLAGS_stage);
  } catch (const cordon::Exception& e) {
    cordon::Log().Error(e.OriginalDescription());
    return 1;
  }

  cordon::Log().Info("Done.");
  return 0;
}
