#include "detect/device_holder_probe.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <string_view>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace camsnitch::detect {

namespace {

// `lsof` exits 1 both for "nothing open" and for "some of the listed files
// are not open", so 0 and 1 are both successful scans.
constexpr int kLsofExitNothingFound = 1;
constexpr int kShellExitCommandNotFound = 127;

std::string ShellSingleQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }
  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  FILE* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    output.append(buffer);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect exit status of: " + command;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
  return true;
}

} // namespace

std::string BuildLsofCommand(const std::vector<std::string>& device_paths) {
  std::string command = "lsof -t --";
  for (const std::string& path : device_paths) {
    command += ' ';
    command += ShellSingleQuote(path);
  }
  // lsof warns on stderr about unrelated mounts; only pids matter here.
  command += " 2>/dev/null";
  return command;
}

std::vector<std::string> ParseLsofPidOutput(const std::string& output) {
  std::vector<std::string> pids;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    bool numeric = true;
    for (const char c : trimmed) {
      if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
        numeric = false;
        break;
      }
    }
    if (numeric) {
      pids.push_back(trimmed);
    }
  }
  return pids;
}

std::vector<std::string> DropOwnAndExitedHolders(const std::vector<std::string>& pids) {
  const pid_t own_group = getpgrp();
  std::vector<std::string> kept;
  for (const std::string& raw : pids) {
    pid_t pid = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), pid);
    if (ec != std::errc() || ptr != raw.data() + raw.size() || pid <= 0) {
      kept.push_back(raw);
      continue;
    }
    const pid_t group = getpgid(pid);
    if (group < 0 && errno == ESRCH) {
      continue;
    }
    if (group == own_group) {
      continue;
    }
    kept.push_back(raw);
  }
  return kept;
}

bool LsofDeviceHolderProbe::FindHolders(const std::vector<std::string>& device_paths,
                                        std::vector<std::string>& holder_pids,
                                        std::string& error) {
  holder_pids.clear();
  error.clear();
  if (device_paths.empty()) {
    return true;
  }

  const std::string command = BuildLsofCommand(device_paths);
  std::string output;
  int exit_code = -1;
  if (!RunShellCommand(command, output, exit_code, error)) {
    return false;
  }

  if (exit_code == kShellExitCommandNotFound) {
    error = "lsof not available on PATH";
    return false;
  }
  if (exit_code != 0 && exit_code != kLsofExitNothingFound) {
    error = "lsof exited with status " + std::to_string(exit_code);
    return false;
  }

  holder_pids = DropOwnAndExitedHolders(ParseLsofPidOutput(output));
  return true;
}

} // namespace camsnitch::detect
