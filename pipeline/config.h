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


#ifndef CORDON_PIPELINE_CONFIG_H
#define CORDON_PIPELINE_CONFIG_H

#include "../port.h"

#include <string>
#include <vector>

#include "../bricks/exception.h"
#include "../bricks/strings/strings.h"
#include "../fetcher/fetcher.h"

namespace cordon {

struct ConfigException : Exception {
  using Exception::Exception;
};

struct PipelineConfig {
  std::string data_dir = "data";
  std::string output_dir = "output";
  // Empty for no mirror, in which case only the artifacts already in `data_dir` are available.
  std::string source_mirror_dir;

  std::vector<int> ingest_years = {2025};

  // The most recent month the analysis requires, synthesized if its raw files are absent.
  int december_target_year = 2025;
  int december_target_month = 12;

  // Pickups before this year are stale rows present in the source files by mistake.
  int quality_cutoff_year = 2023;
  // The surcharge policy went live this year.
  int policy_cutoff_year = 2024;

  int comparison_year_before = 2024;
  int comparison_year_after = 2025;

  bool parallel_aggregations = true;

  WeatherRequest weather;
};

// "2025-12" -> { 2025, 12 }.
inline void ParseYearMonth(const std::string& input, int& year, int& month) {
  const std::vector<std::string> parts = strings::Split(input, '-', strings::EmptyFields::Keep);
  if (parts.size() != 2u || parts[0].length() != 4u || parts[1].length() != 2u ||
      !strings::TryFromString(parts[0], year) || !strings::TryFromString(parts[1], month) || month < 1 ||
      month > 12) {
    CORDON_THROW(ConfigException("Expected a `YYYY-MM` year and month, got `" + input + "`."));
  }
}

// "2024,2025" -> { 2024, 2025 }.
inline std::vector<int> ParseYearList(const std::string& input) {
  std::vector<int> years;
  for (const std::string& chunk : strings::Split(input, ',')) {
    int year = 0;
    if (!strings::TryFromString(chunk, year) || year < 1900 || year > 9999) {
      CORDON_THROW(ConfigException("Expected a comma-separated list of years, got `" + input + "`."));
    }
    years.push_back(year);
  }
  return years;
}

}  // namespace cordon

#endif  // CORDON_PIPELINE_CONFIG_H
