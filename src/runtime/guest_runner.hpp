#pragma once

#include <string>

namespace sandcell::runtime {

inline constexpr const char* kRunnerFileName = "runner.py";
inline constexpr const char* kJobFileName = "job.json";
inline constexpr const char* kSnapshotInFileName = "snapshot_in.json";
inline constexpr const char* kSnapshotOutFileName = "snapshot_out.json";
inline constexpr const char* kResultFileName = "result.json";

// Python source of the in-sandbox runner. It is invoked as
// `python3 runner.py <job.json>`, resolves the other file names relative to
// the job file, restores the snapshot, runs the guest source under the
// import hook and the function-blocking context, and writes result.json and
// snapshot_out.json.
const std::string& GuestRunnerScript();

}  // namespace sandcell::runtime
