// Repository: Encodefarm
// Component: Logging Event Sink
// Copyright (c) 2025 RetroVue

#include "encodefarm/events/LoggingEventSink.hpp"


#include "encodefarm/util/Logger.hpp"

namespace encodefarm::events {

std::string LoggingEventSink::Format(const JobEvent& event) {
  std::string out = event.name + " seq=" + std::to_string(event.sequence);
  if (event.job_id) out += " job=" + std::to_string(*event.job_id);
  if (event.worker_id) out += " server=" + std::to_string(*event.worker_id);
  out += " " + event.payload_json;
  return out;
}

void LoggingEventSink::Deliver(const JobEvent& event) {
  const std::string line = "[Event] " + Format(event);
  if (event.name == kJobProgress || event.name == kJobTransferProgress) {
    util::Logger::Debug(line);
  } else if (event.name == kJobFailed || event.name == kServerAutoDisabled) {
    util::Logger::Warn(line);
  } else {
    util::Logger::Info(line);
  }
}

}  // namespace encodefarm::events
