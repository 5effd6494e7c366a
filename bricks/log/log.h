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


// The process-wide logger. Silent by default, so that tests and library users opt in.
//
//   cordon::Log().LogToStderr();
//   cordon::Log().Info("Stage 'unify' started.");
//
// Each line is `[YYYY-MM-DD HH:MM:SS] LEVEL message`, with the timestamp in UTC.

#ifndef CORDON_BRICKS_LOG_LOG_H
#define CORDON_BRICKS_LOG_LOG_H

#include "../../port.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "../time/chrono.h"
#include "../util/singleton.h"

namespace cordon {
namespace log {

enum class Level : int { Info = 0, Warning = 1, Error = 2 };

inline const char* LevelAsString(Level level) {
  switch (level) {
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARNING";
    case Level::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

class LoggerImpl final {
 public:
  struct Impl {
    virtual ~Impl() = default;
    virtual void Log(const std::string&) const {}
  };

  struct OStreamLogger : Impl {
    std::ostream& os_;
    explicit OStreamLogger(std::ostream& os) : os_(os) {}
    void Log(const std::string& message) const override { os_ << message << std::endl; }
  };

  void Log(Level level, const std::string& message) const {
    const std::string line =
        '[' + FormatDateTime(time::Now()) + "] " + LevelAsString(level) + ' ' + message;
    std::lock_guard<std::mutex> lock(mutex_);
    impl_->Log(line);
  }

  void Info(const std::string& message) const { Log(Level::Info, message); }
  void Warning(const std::string& message) const { Log(Level::Warning, message); }
  void Error(const std::string& message) const { Log(Level::Error, message); }

  void DisableLogging() {
    std::lock_guard<std::mutex> lock(mutex_);
    impl_ = std::make_unique<Impl>();
  }
  void LogToStderr() { LogToStream(std::cerr); }
  void LogToStream(std::ostream& os) {
    std::lock_guard<std::mutex> lock(mutex_);
    impl_ = std::make_unique<OStreamLogger>(os);
  }

 private:
  mutable std::mutex mutex_;
  std::unique_ptr<Impl> impl_{std::make_unique<Impl>()};
};

}  // namespace log

inline log::LoggerImpl& Log() { return Singleton<log::LoggerImpl>(); }

// For tests: captures everything logged within the scope.
struct ScopedLogToStream final {
  explicit ScopedLogToStream(std::ostream& os) { Log().LogToStream(os); }
  ~ScopedLogToStream() { Log().DisableLogging(); }
};

}  // namespace cordon

#endif  // CORDON_BRICKS_LOG_LOG_H
