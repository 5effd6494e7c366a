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


// Minimalistic command line flags.
//
// Usage:
//
//   DEFINE_int32(answer, 42, "Human-readable flag description.");
//   DEFINE_string(question, "six by nine", "Another human-readable flag description.");
//
//   int main(int argc, char** argv) {
//     ParseDFlags(&argc, &argv);
//     std::cout << FLAGS_question.length() << ' ' << FLAGS_answer * FLAGS_answer << std::endl;
//   }
//
// Flags are accepted as `-flag value`, `--flag value`, `-flag=value`, and `--flag=value`.
// Boolean flags require an explicit value, `true` or `false`.
// Parameters that are not flags are kept in `argv`, with `argc` updated accordingly.
// `--help` prints the registered flags and terminates.

#ifndef CORDON_BRICKS_DFLAGS_DFLAGS_H
#define CORDON_BRICKS_DFLAGS_DFLAGS_H

#include "../../port.h"

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "../strings/util.h"

namespace dflags {

class FlagParser {
 public:
  virtual ~FlagParser() = default;
  virtual std::string TypeAsString() const = 0;
  virtual std::string DefaultValueAsString() const = 0;
  virtual std::string Description() const = 0;
  virtual bool ParseValue(const std::string& value) const = 0;
};

class FlagsManager {
 public:
  struct FlagsRegistererSingleton {
    virtual ~FlagsRegistererSingleton() = default;
    virtual void RegisterFlag(const std::string& name, FlagParser* parser) = 0;
    virtual void UnregisterFlag(const std::string& name, FlagParser* parser) = 0;
    virtual void ParseFlags(int& argc, char**& argv) = 0;
    virtual std::ostream& HelpPrinterOStream() const = 0;
    virtual int HelpPrinterReturnCode() const = 0;
  };

  class DefaultRegisterer : public FlagsRegistererSingleton {
   public:
    void RegisterFlag(const std::string& name, FlagParser* parser) override { flags_[name] = parser; }

    void UnregisterFlag(const std::string& name, FlagParser* parser) override {
      const auto cit = flags_.find(name);
      if (cit != flags_.end() && cit->second == parser) {
        flags_.erase(cit);
      }
    }

    void ParseFlags(int& argc, char**& argv) override {
      if (parse_flags_called_) {
        Terminate("ParseDFlags() is called more than once.");
      }
      parse_flags_called_ = true;
      argv_.push_back(argv[0]);
      for (int i = 1; i < argc; ++i) {
        const char* const flag = argv[i];
        size_t dashes = 0;
        while (flag[dashes] == '-') {
          ++dashes;
        }
        if (dashes == 0u) {
          argv_.push_back(argv[i]);
        } else if (dashes > 2u) {
          Terminate("Parameter: '" + std::string(flag) + "' has too many dashes in front.");
        } else {
          const std::string key_value(flag + dashes);
          const size_t eq = key_value.find('=');
          std::string key;
          std::string value;
          if (eq != std::string::npos) {
            key = key_value.substr(0u, eq);
            value = key_value.substr(eq + 1u);
          } else {
            key = key_value;
            if (key == "help") {
              PrintHelpAndExit();
            }
            if (i + 1 == argc) {
              Terminate("Flag: '" + key + "' is not provided with the value.");
            }
            value = argv[++i];
          }
          const auto cit = flags_.find(key);
          if (cit == flags_.end()) {
            Terminate("Undefined flag: '" + key + "'.");
          } else if (!cit->second->ParseValue(value)) {
            Terminate("Can not parse '" + value + "' for flag '" + key + "'.");
          }
        }
      }
      argc = static_cast<int>(argv_.size());
      argv = &argv_[0];
    }

    std::ostream& HelpPrinterOStream() const override { return std::cout; }
    int HelpPrinterReturnCode() const override { return 0; }

   private:
    [[noreturn]] void Terminate(const std::string& message) const {
      std::cerr << message << std::endl;
      std::exit(-1);
    }

    [[noreturn]] void PrintHelpAndExit() const {
      std::ostream& os = HelpPrinterOStream();
      os << flags_.size() << " flags registered.\n";
      for (const auto& cit : flags_) {
        os << "\t--" << cit.first << " , " << cit.second->TypeAsString() << "\n";
        os << "\t\t" << cit.second->Description() << "\n";
        os << "\t\tDefault value: " << cit.second->DefaultValueAsString() << "\n";
      }
      os.flush();
      std::exit(HelpPrinterReturnCode());
    }

    std::map<std::string, FlagParser*> flags_;
    std::vector<char*> argv_;
    bool parse_flags_called_ = false;
  };

  static FlagsRegistererSingleton& Singleton() { return *MockableSingleton(); }

  class ScopedSingletonInjector final {
   public:
    explicit ScopedSingletonInjector(FlagsRegistererSingleton& injected) : previous_(MockableSingleton()) {
      MockableSingleton() = &injected;
    }
    ~ScopedSingletonInjector() { MockableSingleton() = previous_; }

   private:
    FlagsRegistererSingleton* previous_;
  };

 private:
  static FlagsRegistererSingleton*& MockableSingleton() {
    static DefaultRegisterer default_registerer;
    static FlagsRegistererSingleton* singleton = &default_registerer;
    return singleton;
  }
};

template <typename T>
struct FlagValueTraits {
  static std::string Print(const T& value) { return cordon::ToString(value); }
  static bool Parse(const std::string& input, T& output) { return cordon::strings::TryFromString(input, output); }
};

template <>
struct FlagValueTraits<std::string> {
  static std::string Print(const std::string& value) { return '\'' + value + '\''; }
  static bool Parse(const std::string& input, std::string& output) {
    output = input;
    return true;
  }
};

template <typename T>
class FlagRegisterer final : public FlagParser {
 public:
  FlagRegisterer(T& ref, const char* name, const char* type, const T& default_value, const char* description)
      : ref_(ref), name_(name), type_(type), default_value_(default_value), description_(description) {
    FlagsManager::Singleton().RegisterFlag(name_, this);
  }
  ~FlagRegisterer() { FlagsManager::Singleton().UnregisterFlag(name_, this); }

  std::string TypeAsString() const override { return type_; }
  std::string DefaultValueAsString() const override { return FlagValueTraits<T>::Print(default_value_); }
  std::string Description() const override { return description_; }
  bool ParseValue(const std::string& value) const override { return FlagValueTraits<T>::Parse(value, ref_); }

 private:
  T& ref_;
  const std::string name_;
  const std::string type_;
  const T default_value_;
  const std::string description_;
};

}  // namespace dflags

#define DEFINE_flag(type, name, default_value, description) \
  type FLAGS_##name = default_value;                        \
  ::dflags::FlagRegisterer<type> dflags_registerer_##name(  \
      FLAGS_##name, #name, #type, default_value, description)

#define DEFINE_int32(name, default_value, description) DEFINE_flag(int32_t, name, default_value, description)
#define DEFINE_bool(name, default_value, description) DEFINE_flag(bool, name, default_value, description)
#define DEFINE_double(name, default_value, description) DEFINE_flag(double, name, default_value, description)
#define DEFINE_string(name, default_value, description) DEFINE_flag(std::string, name, default_value, description)

inline void ParseDFlags(int* argc, char*** argv) { ::dflags::FlagsManager::Singleton().ParseFlags(*argc, *argv); }

#endif  // CORDON_BRICKS_DFLAGS_DFLAGS_H
