#include "modemstat/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "endpoints/strategy_table.hpp"
#include "poll/poll_config.hpp"
#include "poll/poll_orchestrator.hpp"
#include "snapshot/metric_snapshot.hpp"
#include "transport/device_probe.hpp"
#include "transport/httplib_transport.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace modemstat::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitDeviceUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kDeviceUnavailable);
constexpr int kExitDeviceDegraded = core::errors::ToInt(core::errors::ExitCode::kDeviceDegraded);

constexpr std::string_view kVersion = "0.1.0";

// Sleep granularity of `watch`, so Ctrl-C ends the wait promptly.
constexpr std::chrono::milliseconds kWatchTick{200};

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) {
  g_stop_requested.store(true);
}

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  modemstat poll [--host <host>] [--port <n>] [--timeout-ms <n>] [--retries <n>] "
         "[--config <file.json>] [--strategy-table <file.json>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  modemstat watch [poll options] [--interval-s <n>] [--count <n>]\n"
      << "  modemstat probe [--host <host>] [--port <n>] [--timeout-ms <n>]\n"
      << "  modemstat endpoints [--strategy-table <file.json>]\n"
      << "  modemstat version\n";
}

bool ParseInteger(std::string_view text, std::int64_t& value) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Flags as typed; applied over defaults and the optional config file.
struct CliFlags {
  std::optional<std::string> host;
  std::optional<std::int64_t> port;
  std::optional<std::int64_t> timeout_ms;
  std::optional<std::int64_t> retries;
  std::optional<std::int64_t> interval_s;
  std::optional<std::string> strategy_table;
  std::optional<core::logging::LogLevel> log_level;
  std::string config_path;
  // watch only; 0 means run until interrupted.
  std::int64_t count = 0;
};

struct FlagSpec {
  bool allow_poll_options = true;
  bool allow_watch_options = false;
};

bool ParseFlags(const std::vector<std::string_view>& args, const FlagSpec& spec, CliFlags& flags,
                std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (i + 1 >= args.size()) {
      if (!token.empty() && token.front() == '-') {
        error = "missing value for " + std::string(token);
      } else {
        error = "unexpected argument: " + std::string(token);
      }
      return false;
    }
    const std::string_view value = args[i + 1];
    ++i;

    const auto parse_int = [&](std::optional<std::int64_t>& target) {
      std::int64_t parsed = 0;
      if (!ParseInteger(value, parsed)) {
        error = "invalid integer for " + std::string(token) + ": " + std::string(value);
        return false;
      }
      target = parsed;
      return true;
    };

    if (token == "--host") {
      flags.host = std::string(value);
    } else if (token == "--port") {
      if (!parse_int(flags.port)) {
        return false;
      }
    } else if (token == "--timeout-ms") {
      if (!parse_int(flags.timeout_ms)) {
        return false;
      }
    } else if (token == "--retries" && spec.allow_poll_options) {
      if (!parse_int(flags.retries)) {
        return false;
      }
    } else if (token == "--config" && spec.allow_poll_options) {
      flags.config_path = std::string(value);
    } else if (token == "--strategy-table" && spec.allow_poll_options) {
      flags.strategy_table = std::string(value);
    } else if (token == "--log-level") {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      flags.log_level = parsed;
    } else if (token == "--interval-s" && spec.allow_watch_options) {
      if (!parse_int(flags.interval_s)) {
        return false;
      }
    } else if (token == "--count" && spec.allow_watch_options) {
      std::optional<std::int64_t> count;
      if (!parse_int(count)) {
        return false;
      }
      if (*count < 0) {
        error = "--count must be >= 0";
        return false;
      }
      flags.count = *count;
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }
  return true;
}

// defaults -> config file -> flags.
bool BuildPollConfig(const CliFlags& flags, poll::PollConfig& config, std::string& error) {
  config = poll::PollConfig{};
  if (!flags.config_path.empty() &&
      !poll::LoadPollConfigFromFile(flags.config_path, config, error)) {
    return false;
  }
  if (flags.host.has_value()) {
    config.host = *flags.host;
  }
  if (flags.port.has_value()) {
    config.port = *flags.port;
  }
  if (flags.timeout_ms.has_value()) {
    config.timeout_ms = *flags.timeout_ms;
  }
  if (flags.retries.has_value()) {
    config.max_retries = *flags.retries;
  }
  if (flags.interval_s.has_value()) {
    config.poll_interval_s = *flags.interval_s;
  }
  if (flags.strategy_table.has_value()) {
    config.strategy_table_path = *flags.strategy_table;
  }
  if (flags.log_level.has_value()) {
    config.log_level = *flags.log_level;
  }
  return true;
}

// Explicit path -> MODEMSTAT_STRATEGY_TABLE / nearest config file -> built-in.
bool ResolveStrategyTable(const std::string& explicit_path, endpoints::StrategyTable& table,
                          std::string& source, std::string& error) {
  fs::path path = explicit_path;
  if (path.empty()) {
    path = endpoints::ResolveDefaultStrategyTablePath();
  }
  if (path.empty()) {
    table = endpoints::DefaultStrategyTable();
    source = "built-in";
    return true;
  }
  source = path.string();
  return endpoints::LoadStrategyTableFromFile(path, table, error);
}

bool ValidateOrReport(const poll::PollConfig& config) {
  const poll::ConfigReport report = poll::ValidatePollConfig(config);
  if (report.valid) {
    return true;
  }
  std::cerr << "invalid poll configuration:\n";
  for (const poll::ConfigIssue& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
  return false;
}

int ExitCodeForHealth(poll::HealthVerdict health) {
  switch (health) {
  case poll::HealthVerdict::kHealthy:
    return kExitSuccess;
  case poll::HealthVerdict::kDegraded:
    return kExitDeviceDegraded;
  case poll::HealthVerdict::kUnavailable:
    return kExitDeviceUnavailable;
  }
  return kExitDeviceUnavailable;
}

poll::PollOptions MakePollOptions(const poll::PollConfig& config, std::string poll_id) {
  poll::PollOptions options;
  options.timeout = config.Timeout();
  options.max_retries = static_cast<std::uint32_t>(config.max_retries);
  options.cancel = &g_stop_requested;
  options.poll_id = std::move(poll_id);
  options.device = config.host + ":" + std::to_string(config.port);
  return options;
}

// Shared setup of poll/watch. Returns a non-negative exit code on failure.
int PreparePoll(const std::vector<std::string_view>& args, const FlagSpec& spec,
                std::string_view command, CliFlags& flags, poll::PollConfig& config,
                endpoints::StrategyTable& table, std::string& table_source) {
  std::string error;
  if (!ParseFlags(args, spec, flags, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (!BuildPollConfig(flags, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!ValidateOrReport(config)) {
    return kExitConfigInvalid;
  }
  if (!ResolveStrategyTable(config.strategy_table_path, table, table_source, error)) {
    std::cerr << "error: " << command << ": " << error << '\n';
    return kExitConfigInvalid;
  }
  return -1;
}

int CommandPoll(const std::vector<std::string_view>& args) {
  CliFlags flags;
  poll::PollConfig config;
  endpoints::StrategyTable table;
  std::string table_source;
  if (const int rc = PreparePoll(args, FlagSpec{}, "poll", flags, config, table, table_source);
      rc >= 0) {
    return rc;
  }

  core::logging::Logger logger(config.log_level);
  logger.SetDevice(config.host);
  logger.Debug("strategy table loaded",
               {{"source", table_source}, {"endpoints", std::to_string(table.endpoints().size())}});

  transport::HttplibTransport transport(config.host, static_cast<std::uint16_t>(config.port));
  const poll::PollResult result =
      poll::RunPollCycle(MakePollOptions(config, "poll-1"), table, transport, logger);
  std::cout << poll::ToJson(result) << '\n';
  return ExitCodeForHealth(result.health);
}

int CommandWatch(const std::vector<std::string_view>& args) {
  CliFlags flags;
  poll::PollConfig config;
  endpoints::StrategyTable table;
  std::string table_source;
  const FlagSpec spec{.allow_poll_options = true, .allow_watch_options = true};
  if (const int rc = PreparePoll(args, spec, "watch", flags, config, table, table_source);
      rc >= 0) {
    return rc;
  }

  core::logging::Logger logger(config.log_level);
  logger.SetDevice(config.host);
  transport::HttplibTransport transport(config.host, static_cast<std::uint16_t>(config.port));

  g_stop_requested.store(false);
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  std::optional<snapshot::MetricSnapshot> previous;
  poll::HealthVerdict last_health = poll::HealthVerdict::kUnavailable;
  std::int64_t cycles = 0;
  while (!g_stop_requested.load() && (flags.count == 0 || cycles < flags.count)) {
    ++cycles;
    const auto cycle_started = std::chrono::steady_clock::now();
    poll::PollResult result = poll::RunPollCycle(
        MakePollOptions(config, "poll-" + std::to_string(cycles)), table, transport, logger);
    last_health = result.health;
    std::cout << poll::ToJson(result) << '\n';
    std::cout.flush();

    if (previous.has_value()) {
      const snapshot::SnapshotDiff diff = snapshot::DiffSnapshots(*previous, result.snapshot);
      if (!diff.empty()) {
        logger.Info("snapshot changed", {{"added", std::to_string(diff.added.size())},
                                         {"removed", std::to_string(diff.removed.size())},
                                         {"changed", std::to_string(diff.changed.size())},
                                         {"diff", snapshot::ToJson(diff)}});
      }
    }
    previous = std::move(result.snapshot);

    if (flags.count != 0 && cycles >= flags.count) {
      break;
    }
    const auto next_cycle = cycle_started + config.PollInterval();
    while (!g_stop_requested.load() && std::chrono::steady_clock::now() < next_cycle) {
      std::this_thread::sleep_for(kWatchTick);
    }
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  logger.Info("watch stopped", {{"cycles", std::to_string(cycles)}});
  return ExitCodeForHealth(last_health);
}

int CommandProbe(const std::vector<std::string_view>& args) {
  CliFlags flags;
  std::string error;
  const FlagSpec spec{.allow_poll_options = false, .allow_watch_options = false};
  if (!ParseFlags(args, spec, flags, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  poll::PollConfig config;
  if (!BuildPollConfig(flags, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!ValidateOrReport(config)) {
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(config.log_level);
  logger.SetDevice(config.host);
  transport::HttplibTransport transport(config.host, static_cast<std::uint16_t>(config.port));
  const transport::ProbeReport report = transport::ProbeDevice(transport, config.Timeout());
  if (!report.reachable) {
    logger.Error("device probe failed", {{"error", report.detail}});
    std::cout << "reachable: no\n";
    return kExitDeviceUnavailable;
  }
  if (!report.looks_like_modem) {
    logger.Warn("device answered but does not look like a cable modem",
                {{"detail", report.detail}});
  }
  std::cout << "reachable: yes\n"
            << "http_status: " << report.http_status << '\n'
            << "body_bytes: " << report.body_bytes << '\n'
            << "looks_like_modem: " << (report.looks_like_modem ? "yes" : "no") << '\n';
  return kExitSuccess;
}

int CommandEndpoints(const std::vector<std::string_view>& args) {
  std::string explicit_path;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--strategy-table" && i + 1 < args.size()) {
      explicit_path = std::string(args[++i]);
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  endpoints::StrategyTable table;
  std::string source;
  std::string error;
  if (!ResolveStrategyTable(explicit_path, table, source, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cerr << "strategy table: " << source << '\n';
  std::cout << endpoints::ToJson(table) << '\n';
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "modemstat " << kVersion << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "poll") {
    return CommandPoll(args);
  }
  if (command == "watch") {
    return CommandWatch(args);
  }
  if (command == "probe") {
    return CommandProbe(args);
  }
  if (command == "endpoints") {
    return CommandEndpoints(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace modemstat::cli
