// Repository: Encodefarm
// Component: Transfer Engine
// Copyright (c) 2025 RetroVue

#include "encodefarm/transfer/TransferEngine.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::transfer {

const char* TransferDirectionToString(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::kUpload:
      return "upload";
    case TransferDirection::kDownload:
      return "download";
  }
  return "unknown";
}

const char* TransferStrategyToString(TransferStrategy strategy) {
  switch (strategy) {
    case TransferStrategy::kNone:
      return "none";
    case TransferStrategy::kSegmented:
      return "segmented";
    case TransferStrategy::kBulk:
      return "bulk";
    case TransferStrategy::kChunked:
      return "chunked";
    case TransferStrategy::kRelay:
      return "relay";
  }
  return "unknown";
}

// ============================================================================
// ProgressThrottle
// ============================================================================

ProgressThrottle::ProgressThrottle(TransferDirection direction, int64_t total_bytes,
                                   TransferProgressFn sink, int interval_ms)
    : direction_(direction),
      total_bytes_(total_bytes),
      sink_(std::move(sink)),
      interval_(interval_ms),
      started_(std::chrono::steady_clock::now()),
      last_emit_(started_) {}

void ProgressThrottle::Update(int64_t bytes_done) {
  if (!sink_) return;
  auto now = std::chrono::steady_clock::now();
  if (emitted_any_ && now - last_emit_ < interval_) return;
  Emit(bytes_done);
}

void ProgressThrottle::Complete() {
  if (!sink_) return;
  Emit(total_bytes_);
}

void ProgressThrottle::Emit(int64_t bytes_done) {
  auto now = std::chrono::steady_clock::now();
  last_emit_ = now;
  emitted_any_ = true;

  TransferProgress p;
  p.direction = direction_;
  p.total_bytes = total_bytes_;
  p.bytes_done = std::min(std::max<int64_t>(bytes_done, 0),
                          total_bytes_ > 0 ? total_bytes_ : bytes_done);
  p.percent = total_bytes_ > 0 ? 100.0 * static_cast<double>(p.bytes_done) /
                                     static_cast<double>(total_bytes_)
                               : 100.0;
  double elapsed_s = std::chrono::duration<double>(now - started_).count();
  if (elapsed_s > 0.0) {
    p.speed_bps = static_cast<double>(p.bytes_done) / elapsed_s;
  }
  if (p.speed_bps > 0.0) {
    p.eta_seconds = static_cast<double>(total_bytes_ - p.bytes_done) / p.speed_bps;
  }
  sink_(p);
}

// ============================================================================
// TransferEngine
// ============================================================================

TransferEngine::TransferEngine() : TransferEngine(Options{}) {}

TransferEngine::TransferEngine(Options options) : options_(options) {
  if (options_.segment_count < 1) options_.segment_count = 1;
  if (options_.chunk_bytes < 1) options_.chunk_bytes = 1024 * 1024;
}

std::optional<int64_t> TransferEngine::SourceSize(const TransferRequest& request) {
  return request.direction == TransferDirection::kUpload
             ? local_.FileSize(request.local_path)
             : request.transport->FileSize(request.remote_path);
}

std::optional<int64_t> TransferEngine::DestinationSize(const TransferRequest& request) {
  return request.direction == TransferDirection::kUpload
             ? request.transport->FileSize(request.remote_path)
             : local_.FileSize(request.local_path);
}

std::optional<int64_t> TransferEngine::DestinationAllocated(const TransferRequest& request) {
  return request.direction == TransferDirection::kUpload
             ? request.transport->AllocatedBytes(request.remote_path)
             : local_.AllocatedBytes(request.local_path);
}

TransferResult TransferEngine::Transfer(const TransferRequest& request) {
  TransferResult result;
  if (request.transport == nullptr) {
    result.error = "no transport";
    return result;
  }
  if (util::IsCancelled(request.cancel)) {
    result.cancelled = true;
    result.error = "cancelled";
    return result;
  }

  // The destination must end up exactly the source's size, so the source is
  // always stat'ed; the hint is only cross-checked.
  const bool upload = request.direction == TransferDirection::kUpload;
  std::optional<int64_t> source_size = SourceSize(request);
  if (!source_size) {
    result.error =
        "source not found: " + (upload ? request.local_path : request.remote_path);
    return result;
  }
  const int64_t total = *source_size;
  if (request.size_hint > 0 && request.size_hint != total) {
    util::Logger::Warn("[TransferEngine] size hint " + std::to_string(request.size_hint) +
                       " differs from source size " + std::to_string(total) + " for " +
                       (upload ? request.local_path : request.remote_path));
  }
  result.bytes = total;

  ProgressThrottle throttle(request.direction, total, request.progress,
                            options_.progress_interval_ms);
  const std::string what = std::string(TransferDirectionToString(request.direction)) + " " +
                           request.local_path + " <-> " + request.transport->Describe() +
                           ":" + request.remote_path;

  auto finish = [&](TransferStrategy strategy) {
    result.ok = true;
    result.strategy = strategy;
    throttle.Complete();
    util::Logger::Info("[TransferEngine] " + what + " done via " +
                       TransferStrategyToString(strategy) + " (" + std::to_string(total) +
                       " bytes)");
    return result;
  };
  auto cancelled = [&](TransferStrategy strategy) {
    result.cancelled = true;
    result.strategy = strategy;
    result.error = "cancelled";
    return result;
  };

  PrimitiveResult last;
  if (request.connect && total >= options_.segmented_threshold_bytes &&
      options_.segment_count > 1) {
    last = RunSegmented(request, total, throttle);
    if (last.ok()) return finish(TransferStrategy::kSegmented);
    if (last.status == PrimitiveStatus::kCancelled || util::IsCancelled(request.cancel)) {
      return cancelled(TransferStrategy::kSegmented);
    }
    util::Logger::Warn("[TransferEngine] segmented " + what + " failed (" +
                       PrimitiveStatusToString(last.status) + "): " + last.message +
                       "; falling back to bulk copy");
  }

  PrimitiveResult bulk = RunBulk(request, total, throttle);
  if (bulk.ok()) return finish(TransferStrategy::kBulk);
  if (bulk.status == PrimitiveStatus::kCancelled || util::IsCancelled(request.cancel)) {
    return cancelled(TransferStrategy::kBulk);
  }
  if (bulk.status != PrimitiveStatus::kUnsupported) {
    result.strategy = TransferStrategy::kBulk;
    result.error = "bulk copy failed: " + bulk.message;
    util::Logger::Error("[TransferEngine] " + what + ": " + result.error);
    return result;
  }

  util::Logger::Warn("[TransferEngine] destination rejected bulk copy for " + what +
                     " (" + bulk.message + "); switching to chunked stream");
  PrimitiveResult chunked = RunChunked(request, total, throttle);
  if (chunked.ok()) return finish(TransferStrategy::kChunked);
  if (chunked.status == PrimitiveStatus::kCancelled || util::IsCancelled(request.cancel)) {
    return cancelled(TransferStrategy::kChunked);
  }
  result.strategy = TransferStrategy::kChunked;
  result.error = "chunked transfer failed: " + chunked.message;
  util::Logger::Error("[TransferEngine] " + what + ": " + result.error);
  return result;
}

PrimitiveResult TransferEngine::RunSegmented(const TransferRequest& request, int64_t total,
                                             ProgressThrottle& throttle) {
  const bool upload = request.direction == TransferDirection::kUpload;
  PrimitiveResult prealloc = upload ? request.transport->Preallocate(request.remote_path, total)
                                    : local_.Preallocate(request.local_path, total);
  if (!prealloc.ok()) return prealloc;

  const int n = options_.segment_count;
  const int64_t base = total / n;

  std::mutex mutex;
  std::condition_variable cv;
  int finished = 0;
  std::vector<PrimitiveResult> outcomes(static_cast<size_t>(n));
  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(n));

  for (int i = 0; i < n; ++i) {
    const int64_t offset = base * i;
    const int64_t length = (i == n - 1) ? total - offset : base;
    threads.emplace_back([&, i, offset, length] {
      PrimitiveResult r;
      // A fired token stops segments that have not started; running ones
      // finish their range.
      if (util::IsCancelled(request.cancel)) {
        r = PrimitiveResult::Cancelled();
      } else {
        try {
          std::unique_ptr<ITransport> conn = request.connect();
          if (!conn) {
            r = PrimitiveResult::Failed("could not open segment connection");
          } else if (upload) {
            r = conn->UploadRange(request.local_path, request.remote_path, offset, length);
          } else {
            r = conn->DownloadRange(request.remote_path, request.local_path, offset, length);
          }
        } catch (const std::exception& e) {
          r = PrimitiveResult::Failed(std::string("segment connection: ") + e.what());
        }
        if (r.ok() && r.bytes >= 0 && r.bytes != length) {
          r = PrimitiveResult::Failed("copied " + std::to_string(r.bytes) + " of " +
                                      std::to_string(length) + " bytes");
        }
      }
      std::lock_guard<std::mutex> lock(mutex);
      outcomes[static_cast<size_t>(i)] = std::move(r);
      ++finished;
      cv.notify_all();
    });
  }

  {
    std::unique_lock<std::mutex> lock(mutex);
    while (finished < n) {
      cv.wait_for(lock, std::chrono::milliseconds(options_.allocation_poll_ms));
      if (finished >= n) break;
      lock.unlock();
      if (auto allocated = DestinationAllocated(request)) {
        throttle.Update(std::min(*allocated, total));
      }
      lock.lock();
    }
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < n; ++i) {
    const PrimitiveResult& r = outcomes[static_cast<size_t>(i)];
    if (r.status == PrimitiveStatus::kCancelled) return r;
  }
  for (int i = 0; i < n; ++i) {
    const PrimitiveResult& r = outcomes[static_cast<size_t>(i)];
    if (!r.ok()) {
      return PrimitiveResult{r.status, "segment " + std::to_string(i) + ": " + r.message};
    }
  }

  // Preallocation fixes the destination's length, so the source is checked
  // again: a source that changed under the copy leaves stale ranges behind.
  auto source = SourceSize(request);
  if (!source || *source != total) {
    return PrimitiveResult::Failed(
        "source changed during segmented copy: expected " + std::to_string(total) +
        ", now " + (source ? std::to_string(*source) : std::string("missing")));
  }
  return VerifyDestination(request, total, "segmented");
}

PrimitiveResult TransferEngine::VerifyDestination(const TransferRequest& request, int64_t total,
                                                  const char* strategy) {
  auto size = DestinationSize(request);
  if (!size || *size != total) {
    return PrimitiveResult::Failed(
        std::string("size mismatch after ") + strategy + " copy: expected " +
        std::to_string(total) + ", got " +
        (size ? std::to_string(*size) : std::string("missing")));
  }
  return PrimitiveResult::Ok();
}

PrimitiveResult TransferEngine::RunBulk(const TransferRequest& request, int64_t total,
                                        ProgressThrottle& throttle) {
  BytesProgressFn on_bytes = [&throttle](int64_t bytes) { throttle.Update(bytes); };
  PrimitiveResult r =
      request.direction == TransferDirection::kUpload
          ? request.transport->UploadFile(request.local_path, request.remote_path, on_bytes,
                                          request.cancel)
          : request.transport->DownloadFile(request.remote_path, request.local_path, on_bytes,
                                            request.cancel);
  if (!r.ok()) return r;
  return VerifyDestination(request, total, "bulk");
}

PrimitiveResult TransferEngine::RunChunked(const TransferRequest& request, int64_t total,
                                           ProgressThrottle& throttle) {
  std::vector<char> buffer(static_cast<size_t>(options_.chunk_bytes));
  int64_t moved = 0;

  if (request.direction == TransferDirection::kUpload) {
    std::ifstream in(request.local_path, std::ios::binary);
    if (!in) return PrimitiveResult::Failed("cannot open " + request.local_path);
    auto writer = request.transport->OpenWriter(request.remote_path);
    if (!writer) return PrimitiveResult::Failed("cannot open remote writer");
    while (in) {
      if (util::IsCancelled(request.cancel)) {
        writer->Abort();
        return PrimitiveResult::Cancelled();
      }
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = in.gcount();
      if (got <= 0) break;
      if (!writer->Write(buffer.data(), static_cast<size_t>(got))) {
        writer->Abort();
        return PrimitiveResult::Failed("remote write failed after " + std::to_string(moved) +
                                       " bytes");
      }
      moved += got;
      throttle.Update(moved);
    }
    if (in.bad()) {
      writer->Abort();
      return PrimitiveResult::Failed("read error on " + request.local_path);
    }
    PrimitiveResult done = writer->Finish();
    if (!done.ok()) return done;
  } else {
    auto reader = request.transport->OpenReader(request.remote_path);
    if (!reader) return PrimitiveResult::Failed("cannot open remote reader");
    std::ofstream out(request.local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      (void)reader->Finish();
      return PrimitiveResult::Failed("cannot open " + request.local_path);
    }
    for (;;) {
      if (util::IsCancelled(request.cancel)) {
        (void)reader->Finish();
        return PrimitiveResult::Cancelled();
      }
      int64_t got = reader->Read(buffer.data(), buffer.size());
      if (got == 0) break;
      if (got < 0) {
        (void)reader->Finish();
        return PrimitiveResult::Failed("remote read failed after " + std::to_string(moved) +
                                       " bytes");
      }
      out.write(buffer.data(), static_cast<std::streamsize>(got));
      if (!out) {
        (void)reader->Finish();
        return PrimitiveResult::Failed("local write failed on " + request.local_path);
      }
      moved += got;
      throttle.Update(moved);
    }
    out.close();
    PrimitiveResult done = reader->Finish();
    if (!done.ok()) return done;
  }

  if (moved != total) {
    return PrimitiveResult::Failed("chunked copy moved " + std::to_string(moved) + " of " +
                                   std::to_string(total) + " bytes");
  }
  return VerifyDestination(request, total, "chunked");
}

}  // namespace encodefarm::transfer
