// Repository: Encodefarm
// Component: In-Place Replacer
// Purpose: Swaps a finished encode in for its original with a backup that
//          is only deleted after both renames succeed.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_IN_PLACE_REPLACER_HPP_
#define ENCODEFARM_EXECUTOR_IN_PLACE_REPLACER_HPP_

#include <string>

#include "encodefarm/transfer/ITransport.hpp"

namespace encodefarm::executor {

struct ReplaceResult {
  bool ok = false;
  // Where the new file now lives (extension follows the output container).
  std::string final_path;
  std::string error;
  // The original was put back after a failed swap.
  bool restored = false;
};

// original_path with its extension replaced by container.
std::string FinalPathFor(const std::string& original_path, const std::string& container);

// Backup name used while the swap is in progress.
std::string BackupPathFor(const std::string& original_path);

// Filesystem renames on the controller host.
ReplaceResult ReplaceLocal(const std::string& original_path, const std::string& output_path,
                           const std::string& container);

// The same sequence as a single command on the host behind transport.
ReplaceResult ReplaceRemote(transfer::ITransport& transport, const std::string& original_path,
                            const std::string& output_path, const std::string& container);

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_IN_PLACE_REPLACER_HPP_
