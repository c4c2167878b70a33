// Repository: Encodefarm
// Component: Logging Event Sink
// Purpose: Writes events to the log. Progress events go to the debug
//          stream so they do not flood the info log.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EVENTS_LOGGING_EVENT_SINK_HPP_
#define ENCODEFARM_EVENTS_LOGGING_EVENT_SINK_HPP_

#include "encodefarm/events/IEventSink.hpp"

namespace encodefarm::events {

class LoggingEventSink : public IEventSink {
 public:
  void Deliver(const JobEvent& event) override;

  // "job.failed seq=7 job=12 {...}"
  static std::string Format(const JobEvent& event);
};

}  // namespace encodefarm::events

#endif  // ENCODEFARM_EVENTS_LOGGING_EVENT_SINK_HPP_
