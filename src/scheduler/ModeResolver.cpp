// Repository: Encodefarm
// Component: Mode Resolver
// Copyright (c) 2025 RetroVue

#include "encodefarm/scheduler/ModeResolver.hpp"

#include <algorithm>

namespace encodefarm::scheduler {

using model::TransferMode;

std::optional<std::string> ResolveMappedPath(const std::string& source_path,
                                             const std::vector<model::PathMapping>& mappings) {
  std::vector<const model::PathMapping*> ordered;
  ordered.reserve(mappings.size());
  for (const auto& m : mappings) ordered.push_back(&m);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const model::PathMapping* a, const model::PathMapping* b) {
                     return a->source_prefix.size() > b->source_prefix.size();
                   });

  for (const auto* m : ordered) {
    if (m->source_prefix.empty()) continue;
    if (source_path.compare(0, m->source_prefix.size(), m->source_prefix) == 0) {
      return m->target_prefix + source_path.substr(m->source_prefix.size());
    }
  }
  return std::nullopt;
}

ModeResolution ResolveTransferMode(const std::string& source_path,
                                   bool worker_is_local,
                                   const std::vector<model::PathMapping>& mappings,
                                   bool origin_has_ssh) {
  ModeResolution r;
  if (auto mapped = ResolveMappedPath(source_path, mappings)) {
    r.mode = TransferMode::kMapped;
    r.resolved_path = std::move(mapped);
    return r;
  }
  if (worker_is_local) {
    if (origin_has_ssh) {
      r.mode = TransferMode::kSshPull;
      return r;
    }
    r.mode = TransferMode::kLocal;
    r.resolved_path = source_path;
    return r;
  }
  r.mode = TransferMode::kSshTransfer;
  return r;
}

int TransferCost(TransferMode mode) {
  switch (mode) {
    case TransferMode::kLocal:       return 0;
    case TransferMode::kMapped:      return 25;
    case TransferMode::kSshPull:     return 50;
    case TransferMode::kSshTransfer: return 75;
  }
  return 75;
}

}  // namespace encodefarm::scheduler
