// Repository: Encodefarm
// Component: Mode Resolver
// Purpose: Pure decision: source path + worker locality + path mappings →
//          transfer mode and the worker-visible source path.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_SCHEDULER_MODE_RESOLVER_HPP_
#define ENCODEFARM_SCHEDULER_MODE_RESOLVER_HPP_

#include <optional>
#include <string>
#include <vector>

#include "encodefarm/model/JobTypes.hpp"

namespace encodefarm::scheduler {

struct ModeResolution {
  model::TransferMode mode = model::TransferMode::kLocal;
  // Set for kLocal (the source path itself) and kMapped (rewritten path).
  std::optional<std::string> resolved_path;
};

// Longest matching source_prefix wins, independent of list order. Equal
// length prefixes keep their list order. Empty prefixes never match.
std::optional<std::string> ResolveMappedPath(const std::string& source_path,
                                             const std::vector<model::PathMapping>& mappings);

// No mapping match: a local worker pulls over SSH when the origin exposes
// it, otherwise reads the path as-is; a remote worker gets ssh_transfer.
ModeResolution ResolveTransferMode(const std::string& source_path,
                                   bool worker_is_local,
                                   const std::vector<model::PathMapping>& mappings,
                                   bool origin_has_ssh);

// Scheduling cost of a mode: local=0, mapped=25, ssh_pull=50, ssh_transfer=75.
int TransferCost(model::TransferMode mode);

}  // namespace encodefarm::scheduler

#endif  // ENCODEFARM_SCHEDULER_MODE_RESOLVER_HPP_
