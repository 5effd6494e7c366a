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


// The session of one pipeline run: the configuration, the two table stores, and the source fetcher.
//
// It carries no state between stages. Stages communicate only through the tables they persist,
// so that any stage can be re-run alone once its inputs exist.

#ifndef CORDON_PIPELINE_SESSION_H
#define CORDON_PIPELINE_SESSION_H

#include "../port.h"

#include <string>

#include "config.h"

#include "../bricks/file/file.h"
#include "../fetcher/fetcher.h"
#include "../storage/table.h"

namespace cordon {

class Session final {
 public:
  Session(const PipelineConfig& config, SourceFetcher& fetcher)
      : config_(config), output_(config.output_dir), data_(config.data_dir), fetcher_(fetcher) {
    FileSystem::MkDir(config_.data_dir, FileSystem::MkDirParameters::Silent);
    FileSystem::MkDir(config_.output_dir, FileSystem::MkDirParameters::Silent);
    if (!FileSystem::Exists(config_.data_dir) || !FileSystem::IsDir(config_.data_dir)) {
      CORDON_THROW(PathNotDirException(config_.data_dir));
    }
    if (!FileSystem::Exists(config_.output_dir) || !FileSystem::IsDir(config_.output_dir)) {
      CORDON_THROW(PathNotDirException(config_.output_dir));
    }
  }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const PipelineConfig& Config() const { return config_; }

  // The pipeline tables.
  const TableStore& Output() const { return output_; }

  // The raw files, and the tables cached next to them.
  const TableStore& Data() const { return data_; }
  const std::string& DataDir() const { return config_.data_dir; }

  SourceFetcher& Fetcher() const { return fetcher_; }

 private:
  const PipelineConfig config_;
  const TableStore output_;
  const TableStore data_;
  SourceFetcher& fetcher_;
};

}  // namespace cordon

#endif  // CORDON_PIPELINE_SESSION_H
