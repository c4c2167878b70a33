// Repository: Encodefarm
// Component: gRPC event client
// Purpose: Streams job events to an external JobEventService.
// Copyright (c) 2025 RetroVue

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include "job_events_v1.grpc.pb.h"

#include "encodefarm/events/IEventSink.hpp"

namespace encodefarm::events {

// IEventSink that forwards every event over a client-streaming RPC.
// A dedicated writer thread owns the stream; Deliver() only enqueues.
//
// On disconnect the connection loop reconnects with backoff (100 ms doubling
// to 5 s). Events that arrive while the queue holds kMaxQueuedEvents are
// dropped; delivery is best effort.
class GrpcEventClient : public IEventSink {
 public:
  static constexpr size_t kMaxQueuedEvents = 10000;

  explicit GrpcEventClient(const std::string& target_address);
  ~GrpcEventClient() override;

  GrpcEventClient(const GrpcEventClient&) = delete;
  GrpcEventClient& operator=(const GrpcEventClient&) = delete;

  void Deliver(const JobEvent& event) override;

  bool IsConnected() const { return connected_.load(std::memory_order_relaxed); }
  uint64_t DroppedEvents() const { return dropped_.load(std::memory_order_relaxed); }

  static encodefarm::events::v1::JobEvent ToProto(const JobEvent& event);

 private:
  void ConnectionLoop();
  // Streams until the server goes away or shutdown. True on a clean close.
  bool RunOneSession();

  std::string target_address_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<encodefarm::events::v1::JobEventService::Stub> stub_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<JobEvent> send_queue_;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> connected_{false};
  std::atomic<uint64_t> dropped_{0};

  std::thread connection_thread_;
};

}  // namespace encodefarm::events
