// Repository: Encodefarm
// Component: Time Source
// Purpose: Wall-clock abstraction for record timestamps, backoff deadlines
//          and stuck-job age checks.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TIME_ITIME_SOURCE_HPP_
#define ENCODEFARM_TIME_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace encodefarm::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace encodefarm::time

#endif  // ENCODEFARM_TIME_ITIME_SOURCE_HPP_
