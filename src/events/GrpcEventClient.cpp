// Repository: Encodefarm
// Component: gRPC event client
// Copyright (c) 2025 RetroVue

#include "events/GrpcEventClient.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::events {

namespace proto = encodefarm::events::v1;

namespace {
constexpr uint32_t kSchemaVersion = 1;
}  // namespace

GrpcEventClient::GrpcEventClient(const std::string& target_address)
    : target_address_(target_address),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::JobEventService::NewStub(grpc_channel_)) {
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
}

GrpcEventClient::~GrpcEventClient() {
  shutdown_.store(true, std::memory_order_release);
  queue_cv_.notify_all();
  if (connection_thread_.joinable()) {
    connection_thread_.join();
  }
}

void GrpcEventClient::Deliver(const JobEvent& event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (send_queue_.size() >= kMaxQueuedEvents) {
      uint64_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
      if (dropped == 1 || dropped % 1000 == 0) {
        util::Logger::Warn("[GrpcEventClient] queue full, dropped " + std::to_string(dropped) +
                           " events");
      }
      return;
    }
    send_queue_.push_back(event);
  }
  queue_cv_.notify_one();
}

proto::JobEvent GrpcEventClient::ToProto(const JobEvent& e) {
  proto::JobEvent p;
  p.set_schema_version(kSchemaVersion);
  p.set_sequence(e.sequence);
  p.set_event_uuid(e.event_uuid);
  p.set_emitted_utc(e.emitted_utc);
  p.set_emitted_utc_ms(e.emitted_utc_ms);
  p.set_name(e.name);
  p.set_job_id(e.job_id.value_or(0));
  p.set_worker_id(e.worker_id.value_or(0));
  p.set_payload_json(e.payload_json);
  return p;
}

// ---------------------------------------------------------------------------
// Connection loop: reconnect with backoff
// ---------------------------------------------------------------------------

void GrpcEventClient::ConnectionLoop() {
  constexpr int kInitialBackoffMs = 100;
  constexpr int kMaxBackoffMs = 5000;
  int backoff_ms = kInitialBackoffMs;

  while (!shutdown_.load(std::memory_order_acquire)) {
    bool ok = RunOneSession();
    connected_.store(false, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire)) break;
    if (ok) {
      backoff_ms = kInitialBackoffMs;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms), [this] {
      return shutdown_.load(std::memory_order_relaxed);
    });
    backoff_ms = std::min(backoff_ms * 2, kMaxBackoffMs);
  }
}

// ---------------------------------------------------------------------------
// Single stream session
// ---------------------------------------------------------------------------

bool GrpcEventClient::RunOneSession() {
  // Do not open a stream until there is something to send.
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this] {
      return !send_queue_.empty() || shutdown_.load(std::memory_order_relaxed);
    });
    if (shutdown_.load(std::memory_order_relaxed)) return true;
  }

  grpc::ClientContext context;
  proto::StreamAck ack;
  auto writer = stub_->StreamEvents(&context, &ack);
  if (!writer) return false;
  connected_.store(true, std::memory_order_relaxed);

  while (!shutdown_.load(std::memory_order_relaxed)) {
    std::vector<JobEvent> batch;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, std::chrono::milliseconds(50), [this] {
        return !send_queue_.empty() || shutdown_.load(std::memory_order_relaxed);
      });
      batch.assign(std::make_move_iterator(send_queue_.begin()),
                   std::make_move_iterator(send_queue_.end()));
      send_queue_.clear();
    }

    for (size_t i = 0; i < batch.size(); ++i) {
      if (!writer->Write(ToProto(batch[i]))) {
        // Server went away; keep the unsent tail for the next session.
        {
          std::lock_guard<std::mutex> lock(queue_mutex_);
          for (size_t j = batch.size(); j > i; --j) {
            if (send_queue_.size() >= kMaxQueuedEvents) break;
            send_queue_.push_front(std::move(batch[j - 1]));
          }
        }
        grpc::Status status = writer->Finish();
        util::Logger::Warn("[GrpcEventClient] stream to " + target_address_ +
                           " lost: " + status.error_message());
        return false;
      }
    }
  }

  writer->WritesDone();
  grpc::Status status = writer->Finish();
  if (!status.ok()) {
    util::Logger::Warn("[GrpcEventClient] stream close: " + status.error_message());
    return false;
  }
  util::Logger::Debug("[GrpcEventClient] server acknowledged " +
                      std::to_string(ack.events_received()) + " events");
  return true;
}

}  // namespace encodefarm::events
