// Repository: Encodefarm
// Component: In-Place Replacer
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/InPlaceReplacer.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "encodefarm/util/Logger.hpp"
#include "encodefarm/util/Subprocess.hpp"

namespace encodefarm::executor {

namespace {

// Exit codes of the remote swap script.
constexpr int kBackupFailed = 11;
constexpr int kSwapFailed = 12;

}  // namespace

std::string FinalPathFor(const std::string& original_path, const std::string& container) {
  std::string base = original_path;
  size_t slash = base.find_last_of('/');
  size_t dot = base.find_last_of('.');
  if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
    base.erase(dot);
  }
  return base + "." + container;
}

std::string BackupPathFor(const std::string& original_path) {
  return original_path + ".original";
}

ReplaceResult ReplaceLocal(const std::string& original_path, const std::string& output_path,
                           const std::string& container) {
  ReplaceResult result;
  result.final_path = FinalPathFor(original_path, container);
  const std::string backup = BackupPathFor(original_path);

  if (std::rename(original_path.c_str(), backup.c_str()) != 0) {
    result.error = "backup rename failed for " + original_path + ": " + std::strerror(errno);
    return result;
  }
  if (std::rename(output_path.c_str(), result.final_path.c_str()) != 0) {
    result.error = "moving " + output_path + " into place failed: " + std::strerror(errno);
    if (std::rename(backup.c_str(), original_path.c_str()) == 0) {
      result.restored = true;
    } else {
      result.error += "; restoring backup failed: " + std::string(std::strerror(errno));
    }
    util::Logger::Error("[InPlaceReplacer] " + result.error);
    return result;
  }
  if (unlink(backup.c_str()) != 0 && errno != ENOENT) {
    util::Logger::Warn("[InPlaceReplacer] Could not remove backup " + backup + ": " +
                       std::strerror(errno));
  }
  result.ok = true;
  return result;
}

ReplaceResult ReplaceRemote(transfer::ITransport& transport, const std::string& original_path,
                            const std::string& output_path, const std::string& container) {
  using util::ShellQuote;
  ReplaceResult result;
  result.final_path = FinalPathFor(original_path, container);
  const std::string src = ShellQuote(original_path);
  const std::string bak = ShellQuote(BackupPathFor(original_path));
  const std::string out = ShellQuote(output_path);
  const std::string fin = ShellQuote(result.final_path);

  const std::string script = "mv -f " + src + " " + bak + " || exit " +
                             std::to_string(kBackupFailed) + "; if mv -f " + out + " " + fin +
                             "; then rm -f " + bak + "; else mv -f " + bak + " " + src +
                             "; exit " + std::to_string(kSwapFailed) + "; fi";
  transfer::CommandResult r = transport.RunCommand(script);
  if (r.ok()) {
    result.ok = true;
    return result;
  }
  if (r.exit_status == kSwapFailed) {
    result.restored = true;
    result.error = "moving " + output_path + " into place failed on " + transport.Describe() +
                   ": " + r.stderr_text;
  } else if (r.exit_status == kBackupFailed) {
    result.error = "backup rename failed on " + transport.Describe() + ": " + r.stderr_text;
  } else {
    result.error = "replace command exited " + std::to_string(r.exit_status) + " on " +
                   transport.Describe() + ": " + r.stderr_text;
  }
  util::Logger::Error("[InPlaceReplacer] " + result.error);
  return result;
}

}  // namespace encodefarm::executor
