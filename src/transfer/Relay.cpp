// Repository: Encodefarm
// Component: Relay
// Copyright (c) 2025 RetroVue

#include "encodefarm/transfer/Relay.hpp"

#include <atomic>
#include <thread>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::transfer {

bool ChunkQueue::Push(std::unique_ptr<std::string> chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || chunks_.size() < capacity_; });
  if (closed_) return false;
  chunks_.push_back(std::move(chunk));
  cv_.notify_all();
  return true;
}

std::unique_ptr<std::string> ChunkQueue::Pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !chunks_.empty(); });
  auto chunk = std::move(chunks_.front());
  chunks_.pop_front();
  cv_.notify_all();
  return chunk;
}

void ChunkQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  chunks_.clear();
  cv_.notify_all();
}

TransferResult RelayFile(ITransport& src, const std::string& src_path, ITransport& dst,
                         const std::string& dst_path, int64_t size_hint,
                         const TransferProgressFn& progress,
                         const util::CancellationToken* cancel,
                         const RelayOptions& options) {
  TransferResult result;
  result.strategy = TransferStrategy::kRelay;
  const std::string what =
      src.Describe() + ":" + src_path + " -> " + dst.Describe() + ":" + dst_path;

  if (util::IsCancelled(cancel)) {
    result.cancelled = true;
    result.error = "cancelled";
    return result;
  }

  auto reader = src.OpenReader(src_path);
  if (!reader) {
    result.error = "cannot open relay source " + src_path;
    return result;
  }
  auto writer = dst.OpenWriter(dst_path);
  if (!writer) {
    PrimitiveResult closed = reader->Finish();
    result.error = "cannot open relay destination " + dst_path + " (" + closed.message + ")";
    return result;
  }

  ChunkQueue queue(options.queue_chunks == 0 ? 1 : options.queue_chunks);
  std::string reader_error;
  std::atomic<bool> reader_cancelled{false};

  std::thread reader_thread([&] {
    for (;;) {
      if (util::IsCancelled(cancel)) {
        reader_cancelled = true;
        break;
      }
      auto chunk = std::make_unique<std::string>(options.chunk_bytes, '\0');
      size_t filled = 0;
      bool eof = false;
      while (filled < chunk->size()) {
        int64_t got = reader->Read(&(*chunk)[filled], chunk->size() - filled);
        if (got == 0) {
          eof = true;
          break;
        }
        if (got < 0) {
          reader_error = "read failed on " + src_path;
          break;
        }
        filled += static_cast<size_t>(got);
      }
      if (!reader_error.empty()) break;
      if (filled > 0) {
        chunk->resize(filled);
        if (!queue.Push(std::move(chunk))) return;  // writer gave up
      }
      if (eof) break;
    }
    PrimitiveResult finished = reader->Finish();
    if (reader_error.empty() && !reader_cancelled && !finished.ok()) {
      reader_error = "relay source exited: " + finished.message;
    }
    queue.Push(nullptr);
  });

  ProgressThrottle throttle(TransferDirection::kDownload, size_hint, progress,
                            options.progress_interval_ms);
  int64_t written = 0;
  std::string writer_error;
  for (;;) {
    auto chunk = queue.Pop();
    if (!chunk) break;
    if (util::IsCancelled(cancel)) {
      writer_error = "cancelled";
      break;
    }
    if (!writer->Write(chunk->data(), chunk->size())) {
      writer_error = "write failed on " + dst_path;
      break;
    }
    written += static_cast<int64_t>(chunk->size());
    throttle.Update(written);
  }

  if (!writer_error.empty()) {
    queue.Close();
    writer->Abort();
    reader_thread.join();
    if (util::IsCancelled(cancel)) {
      result.cancelled = true;
      result.error = "cancelled";
    } else {
      result.error = writer_error;
      util::Logger::Error("[Relay] " + what + ": " + writer_error);
    }
    return result;
  }

  reader_thread.join();
  if (reader_cancelled) {
    writer->Abort();
    result.cancelled = true;
    result.error = "cancelled";
    return result;
  }
  if (!reader_error.empty()) {
    writer->Abort();
    result.error = reader_error;
    util::Logger::Error("[Relay] " + what + ": " + reader_error);
    return result;
  }
  PrimitiveResult flushed = writer->Finish();
  if (!flushed.ok()) {
    result.error = "relay destination failed: " + flushed.message;
    util::Logger::Error("[Relay] " + what + ": " + result.error);
    return result;
  }

  auto landed = dst.FileSize(dst_path);
  if (!landed || *landed != written) {
    result.error = "relay size mismatch: wrote " + std::to_string(written) + ", destination has " +
                   (landed ? std::to_string(*landed) : std::string("nothing"));
    util::Logger::Error("[Relay] " + what + ": " + result.error);
    return result;
  }

  result.ok = true;
  result.bytes = written;
  if (size_hint <= 0) {
    ProgressThrottle sized(TransferDirection::kDownload, written, progress, 0);
    sized.Complete();
  } else {
    throttle.Complete();
  }
  util::Logger::Info("[Relay] " + what + " done (" + std::to_string(written) + " bytes)");
  return result;
}

}  // namespace encodefarm::transfer
