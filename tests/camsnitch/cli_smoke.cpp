#include "camsnitch/cli/router.hpp"
#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <string>
#include <string_view>
#include <vector>

using camsnitch::tests::common::AssertContains;
using camsnitch::tests::common::AssertNotContains;
using camsnitch::tests::common::AssertTrue;
using camsnitch::tests::common::DispatchCaptured;
using camsnitch::tests::common::Fail;

namespace {

void VersionAndHelp() {
  const auto version = DispatchCaptured({"camsnitch", "version"});
  AssertTrue(version.exit_code == 0, "version must succeed");
  AssertContains(version.stdout_text, "camsnitch 0.1.0");

  const auto version_extra = DispatchCaptured({"camsnitch", "version", "now"});
  AssertTrue(version_extra.exit_code == 2, "version with args is a usage error");
  AssertContains(version_extra.stderr_text, "version does not accept arguments");

  const auto help = DispatchCaptured({"camsnitch", "help"});
  AssertTrue(help.exit_code == 0, "help must succeed");
  AssertContains(help.stdout_text, "camsnitch [run]");
  AssertContains(help.stdout_text, "--debounce-ms");
}

void UsageErrors() {
  const auto unknown_command = DispatchCaptured({"camsnitch", "watch"});
  AssertTrue(unknown_command.exit_code == 2, "unknown subcommand is a usage error");
  AssertContains(unknown_command.stderr_text, "error: unknown subcommand: watch");

  const auto unknown_flag = DispatchCaptured({"camsnitch", "run", "--bogus", "1"});
  AssertTrue(unknown_flag.exit_code == 2, "unknown flag is a usage error");
  AssertContains(unknown_flag.stderr_text, "error: unknown option: --bogus");

  const auto missing_value = DispatchCaptured({"camsnitch", "--mqtt-port"});
  AssertTrue(missing_value.exit_code == 2, "missing value is a usage error");
  AssertContains(missing_value.stderr_text, "missing value for --mqtt-port");

  const auto bad_number = DispatchCaptured({"camsnitch", "run", "--mqtt-port", "abc"});
  AssertTrue(bad_number.exit_code == 2, "non-numeric port is a usage error");
  AssertContains(bad_number.stderr_text, "invalid value for --mqtt-port: 'abc'");

  const auto long_keep_alive = DispatchCaptured({"camsnitch", "run", "--keep-alive", "70000"});
  AssertTrue(long_keep_alive.exit_code == 2, "keep-alive beyond 65535 is a usage error");
  AssertContains(long_keep_alive.stderr_text,
                 "invalid value for --keep-alive: '70000' (expected whole number in range "
                 "[0,65535])");

  const auto bad_detector = DispatchCaptured({"camsnitch", "run", "--detector", "sniff"});
  AssertTrue(bad_detector.exit_code == 2, "unknown detector is a usage error");
  AssertContains(bad_detector.stderr_text, "invalid detector 'sniff'");

  const auto positional = DispatchCaptured({"camsnitch", "run", "extra"});
  AssertTrue(positional.exit_code == 2, "positional argument is a usage error");
  AssertContains(positional.stderr_text, "unexpected argument: extra");
}

void InvalidConfigurationIsReported() {
  const auto bad_node = DispatchCaptured({"camsnitch", "run", "--node-id", "office/camera",
                                          "--mqtt-host", ""});
  AssertTrue(bad_node.exit_code == 10, "invalid values must map to the config exit code");
  AssertContains(bad_node.stderr_text, "error: invalid configuration");
  AssertContains(bad_node.stderr_text, "  - node_id: node id may only contain [A-Za-z0-9_-]");
  AssertContains(bad_node.stderr_text, "  - mqtt_host: broker host cannot be empty");

  const auto missing_file =
      DispatchCaptured({"camsnitch", "--config", "/nonexistent/camsnitch.json"});
  AssertTrue(missing_file.exit_code == 10, "missing config file is a config error");
  AssertContains(missing_file.stderr_text, "unable to open config file");

  camsnitch::tests::common::ScopedTempDir dir("camsnitch-cli");
  const auto config_path = dir.path() / "camsnitch.json";
  camsnitch::tests::common::WriteTextFile(config_path, R"({"mqtt_host":"a","colour":"red"})");
  const auto unknown_key = DispatchCaptured({"camsnitch", "--config", config_path.string()});
  AssertTrue(unknown_key.exit_code == 10, "unknown config key is a config error");
  AssertContains(unknown_key.stderr_text, "unknown config key 'colour'");
  AssertNotContains(unknown_key.stderr_text, "usage:");
}

void FlagsOverrideConfigFile() {
  camsnitch::tests::common::ScopedTempDir dir("camsnitch-cli-merge");
  const auto config_path = dir.path() / "camsnitch.json";
  camsnitch::tests::common::WriteTextFile(
      config_path, R"({"mqtt_host":"from-file","mqtt_port":1884,"node_id":"den"})");

  const std::vector<std::string_view> args = {"--mqtt-port", "8883",       "--config",
                                              config_path.c_str(), "--node-id", "lab_cam"};
  camsnitch::cli::RunOptions options;
  std::string error;
  if (!camsnitch::cli::ParseRunOptions(args, options, error)) {
    Fail("ParseRunOptions failed: " + error);
  }
  AssertTrue(options.config_path == config_path.string(), "config path must be captured");
  AssertTrue(options.flag_values.size() == 2U, "two flag values expected");

  camsnitch::config::DaemonConfig config;
  if (!camsnitch::config::LoadConfigFile(options.config_path, config, error)) {
    Fail("LoadConfigFile failed: " + error);
  }
  if (!camsnitch::cli::ApplyFlagValues(options, config, error)) {
    Fail("ApplyFlagValues failed: " + error);
  }
  AssertTrue(config.broker.host == "from-file", "file value must survive");
  AssertTrue(config.broker.port == 8883U, "flag must override file");
  AssertTrue(config.identity.node_id == "lab_cam", "flag must override file");

  camsnitch::cli::RunOptions twice;
  AssertTrue(!camsnitch::cli::ParseRunOptions({"--config", "a.json", "--config", "b.json"}, twice,
                                              error),
             "--config twice must be rejected");
  AssertContains(error, "--config may only be given once");
}

} // namespace

int main() {
  VersionAndHelp();
  UsageErrors();
  InvalidConfigurationIsReported();
  FlagsOverrideConfigFile();
  return 0;
}
