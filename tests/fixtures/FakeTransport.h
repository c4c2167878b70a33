// Repository: Encodefarm
// Component: Fake Transport
// Purpose: Test transport whose "remote" host is a directory on this
//          machine. Counts every primitive, records commands, and lets a
//          test script the encoder and inject bulk or range copy failures.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TESTS_FIXTURES_FAKE_TRANSPORT_H_
#define ENCODEFARM_TESTS_FIXTURES_FAKE_TRANSPORT_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "encodefarm/executor/FfmpegCommandBuilder.hpp"
#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/LocalTransport.hpp"

namespace encodefarm::tests::fixtures {

// Shared state of one fake host. Every FakeTransport opened on it (one per
// connection) reports into the same counters.
struct FakeHost {
  using EncoderFn = std::function<transfer::CommandResult(
      const std::string& command, const transfer::LineCallback& on_line,
      const util::CancellationToken* cancel)>;
  // Answers a RunCommand; nullopt lets the real shell run it.
  using ResponderFn = std::function<std::optional<transfer::CommandResult>(const std::string&)>;
  // Answers a range copy by offset and length; nullopt lets it copy.
  using RangeFn =
      std::function<std::optional<transfer::PrimitiveResult>(int64_t offset, int64_t length)>;

  FakeHost(std::string host_name, bool local) : name(std::move(host_name)), is_local(local) {}

  std::vector<std::string> Commands() const {
    std::lock_guard<std::mutex> lock(mutex);
    return commands;
  }

  void Record(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex);
    commands.push_back(command);
  }

  const std::string name;
  const bool is_local;
  std::atomic<bool> reachable{true};

  // Set before the host is used.
  EncoderFn encoder;
  ResponderFn responder;
  RangeFn range_hook;

  // kOk means no injected failure. upload_failure hits only UploadFile.
  std::atomic<transfer::PrimitiveStatus> bulk_failure{transfer::PrimitiveStatus::kOk};
  std::atomic<transfer::PrimitiveStatus> upload_failure{transfer::PrimitiveStatus::kOk};

  std::atomic<int> connections{0};
  std::atomic<int> uploads{0};
  std::atomic<int> downloads{0};
  std::atomic<int> range_copies{0};
  std::atomic<int> readers{0};
  std::atomic<int> writers{0};
  std::atomic<int> encoder_runs{0};

  mutable std::mutex mutex;
  std::vector<std::string> commands;  // Guarded by mutex
};

class FakeTransport : public transfer::LocalTransport {
 public:
  explicit FakeTransport(std::shared_ptr<FakeHost> host) : host_(std::move(host)) {
    host_->connections++;
  }

  std::string Describe() const override { return host_->name; }
  bool IsLocal() const override { return host_->is_local; }
  bool TestConnection() override { return host_->reachable.load(); }

  transfer::CommandResult RunCommand(const std::string& command) override {
    host_->Record(command);
    if (!host_->reachable.load()) return Unreachable();
    if (host_->responder) {
      if (auto answer = host_->responder(command)) return *answer;
    }
    return LocalTransport::RunCommand(command);
  }

  transfer::CommandResult RunCommandStreaming(const std::string& command,
                                              const transfer::LineCallback& on_line,
                                              const util::CancellationToken* cancel) override {
    host_->Record(command);
    if (!host_->reachable.load()) return Unreachable();
    if (host_->encoder) {
      host_->encoder_runs++;
      return host_->encoder(command, on_line, cancel);
    }
    return LocalTransport::RunCommandStreaming(command, on_line, cancel);
  }

  transfer::PrimitiveResult UploadFile(const std::string& local_path,
                                       const std::string& remote_path,
                                       const transfer::BytesProgressFn& progress,
                                       const util::CancellationToken* cancel) override {
    host_->uploads++;
    if (auto injected = InjectedFailure(host_->upload_failure.load())) return *injected;
    if (auto injected = InjectedFailure(host_->bulk_failure.load())) return *injected;
    return LocalTransport::UploadFile(local_path, remote_path, progress, cancel);
  }

  transfer::PrimitiveResult DownloadFile(const std::string& remote_path,
                                         const std::string& local_path,
                                         const transfer::BytesProgressFn& progress,
                                         const util::CancellationToken* cancel) override {
    host_->downloads++;
    if (auto injected = InjectedFailure(host_->bulk_failure.load())) return *injected;
    return LocalTransport::DownloadFile(remote_path, local_path, progress, cancel);
  }

  transfer::PrimitiveResult UploadRange(const std::string& local_path,
                                        const std::string& remote_path, int64_t offset,
                                        int64_t length) override {
    host_->range_copies++;
    if (host_->range_hook) {
      if (auto answer = host_->range_hook(offset, length)) return *answer;
    }
    return LocalTransport::UploadRange(local_path, remote_path, offset, length);
  }

  transfer::PrimitiveResult DownloadRange(const std::string& remote_path,
                                          const std::string& local_path, int64_t offset,
                                          int64_t length) override {
    host_->range_copies++;
    if (host_->range_hook) {
      if (auto answer = host_->range_hook(offset, length)) return *answer;
    }
    return LocalTransport::DownloadRange(remote_path, local_path, offset, length);
  }

  std::unique_ptr<transfer::IByteReader> OpenReader(const std::string& path) override {
    host_->readers++;
    return LocalTransport::OpenReader(path);
  }

  std::unique_ptr<transfer::IByteWriter> OpenWriter(const std::string& path) override {
    host_->writers++;
    return LocalTransport::OpenWriter(path);
  }

 private:
  static transfer::CommandResult Unreachable() {
    transfer::CommandResult r;
    r.exit_status = 255;
    r.stderr_text = "ssh: connect to host: Connection refused";
    return r;
  }

  static std::optional<transfer::PrimitiveResult> InjectedFailure(
      transfer::PrimitiveStatus status) {
    switch (status) {
      case transfer::PrimitiveStatus::kOk:
        return std::nullopt;
      case transfer::PrimitiveStatus::kUnsupported:
        return transfer::PrimitiveResult::Unsupported("rsync: Operation not supported (95)");
      case transfer::PrimitiveStatus::kFailed:
        return transfer::PrimitiveResult::Failed("rsync: connection unexpectedly closed");
      case transfer::PrimitiveStatus::kCancelled:
        return transfer::PrimitiveResult::Cancelled();
    }
    return std::nullopt;
  }

  std::shared_ptr<FakeHost> host_;
};

class FakeTransportFactory : public transfer::ITransportFactory {
 public:
  std::shared_ptr<FakeHost> AddWorkerHost(int64_t worker_id, const std::string& name,
                                          bool is_local = false) {
    auto host = std::make_shared<FakeHost>(name, is_local);
    std::lock_guard<std::mutex> lock(mutex_);
    workers_[worker_id] = host;
    return host;
  }

  std::shared_ptr<FakeHost> SetOrigin(const std::string& name = "origin") {
    auto host = std::make_shared<FakeHost>(name, false);
    std::lock_guard<std::mutex> lock(mutex_);
    origin_ = host;
    return host;
  }

  std::unique_ptr<transfer::ITransport> ForWorker(const model::Worker& worker) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(worker.id);
    if (it == workers_.end()) return nullptr;
    return std::make_unique<FakeTransport>(it->second);
  }

  std::unique_ptr<transfer::ITransport> ForOrigin() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!origin_) return nullptr;
    return std::make_unique<FakeTransport>(origin_);
  }

  bool OriginHasSsh() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return origin_ != nullptr;
  }

 private:
  mutable std::mutex mutex_;
  std::map<int64_t, std::shared_ptr<FakeHost>> workers_;
  std::shared_ptr<FakeHost> origin_;
};

// =============================================================================
// Scripted encoders
// The output path is always the last argument of the built command.
// =============================================================================

inline std::string OutputPathOf(const std::string& command) {
  std::vector<std::string> words = executor::SplitCommandLine(command);
  return words.empty() ? std::string() : words.back();
}

inline std::string InputPathOf(const std::string& command) {
  std::vector<std::string> words = executor::SplitCommandLine(command);
  for (size_t i = 0; i + 1 < words.size(); ++i) {
    if (words[i] == "-i") return words[i + 1];
  }
  return "";
}

// Prints two progress lines, then writes output_bytes to the output path.
inline FakeHost::EncoderFn WritingEncoder(int64_t output_bytes) {
  return [output_bytes](const std::string& command, const transfer::LineCallback& on_line,
                        const util::CancellationToken*) {
    if (on_line) {
      on_line("frame=  120 fps= 48 q=28.0 size=    1024kB time=00:00:05.00 bitrate=1677.7kbits/s speed=2.0x");
      on_line("frame=  240 fps= 48 q=28.0 size=    2048kB time=00:00:10.00 bitrate=1677.7kbits/s speed=2.0x");
    }
    std::ofstream out(OutputPathOf(command), std::ios::binary | std::ios::trunc);
    out << std::string(static_cast<size_t>(output_bytes), 'e');
    transfer::CommandResult r;
    r.exit_status = out ? 0 : 1;
    return r;
  };
}

// Prints diagnostics and exits with status 1 without writing anything.
inline FakeHost::EncoderFn FailingEncoder(std::vector<std::string> diagnostics) {
  return [diagnostics](const std::string&, const transfer::LineCallback& on_line,
                       const util::CancellationToken*) {
    if (on_line) {
      for (const auto& line : diagnostics) on_line(line);
    }
    transfer::CommandResult r;
    r.exit_status = 1;
    return r;
  };
}

// Runs until its token fires, then reports a terminated command. started is
// set once the encoder is running.
inline FakeHost::EncoderFn BlockingEncoder(std::shared_ptr<std::atomic<bool>> started) {
  return [started](const std::string&, const transfer::LineCallback&,
                   const util::CancellationToken* cancel) {
    started->store(true);
    while (!util::IsCancelled(cancel)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    transfer::CommandResult r;
    r.exit_status = 143;
    r.cancelled = true;
    return r;
  };
}

}  // namespace encodefarm::tests::fixtures

#endif  // ENCODEFARM_TESTS_FIXTURES_FAKE_TRANSPORT_H_
