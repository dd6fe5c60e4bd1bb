#pragma once

#include <string>
#include <vector>

namespace camsnitch::detect {

// Answers "which processes currently hold any of these device nodes open?".
// Seam used by the poll-based detector so tests can script probe results.
class IDeviceHolderProbe {
public:
  virtual ~IDeviceHolderProbe() = default;

  // Fills `holder_pids` (possibly empty). `false` means the probe itself
  // could not run or produced output it could not interpret.
  virtual bool FindHolders(const std::vector<std::string>& device_paths,
                           std::vector<std::string>& holder_pids, std::string& error) = 0;
};

// Probe backed by `lsof -t`. Requires `lsof` on PATH.
//
// The shell spawned for `lsof` inherits the daemon's descriptors, so holders
// in the daemon's own process group, and holders that exited before the scan
// finished, are dropped from the result.
class LsofDeviceHolderProbe final : public IDeviceHolderProbe {
public:
  bool FindHolders(const std::vector<std::string>& device_paths,
                   std::vector<std::string>& holder_pids, std::string& error) override;
};

// Builds the shell command used by `LsofDeviceHolderProbe`. Paths are single
// quoted so glob results containing spaces or quotes cannot break out.
std::string BuildLsofCommand(const std::vector<std::string>& device_paths);

// Extracts pid lines from `lsof -t` output; blank and non-numeric lines are
// skipped.
std::vector<std::string> ParseLsofPidOutput(const std::string& output);

// Removes pids in the caller's process group and pids that no longer exist.
// Unparseable entries are kept.
std::vector<std::string> DropOwnAndExitedHolders(const std::vector<std::string>& pids);

} // namespace camsnitch::detect
