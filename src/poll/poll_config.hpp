#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace modemstat::poll {

inline constexpr std::string_view kDefaultHost = "192.168.100.1";

// Per-device poll settings. Values are kept as entered so validation can
// report them back verbatim; use the accessors for typed durations.
struct PollConfig {
  std::string host = std::string(kDefaultHost);
  std::int64_t port = 80;
  std::int64_t poll_interval_s = 30;
  std::int64_t timeout_ms = 5000;
  std::int64_t max_retries = 1;
  // Empty means: resolve the default strategy table location.
  std::string strategy_table_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;

  std::chrono::milliseconds Timeout() const {
    return std::chrono::milliseconds(timeout_ms);
  }

  std::chrono::seconds PollInterval() const {
    return std::chrono::seconds(poll_interval_s);
  }
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

// Checks a config before the first poll. Never fails; all problems are issues.
ConfigReport ValidatePollConfig(const PollConfig& config);

// "host: must not include a scheme; port: must be in 1..65535"
std::string FormatConfigIssues(const ConfigReport& report);

// Applies members of a JSON object onto `config`; missing members keep their
// current value so CLI defaults and file values compose.
//
// {"host": "192.168.0.1", "port": 80, "poll_interval_s": 30, "timeout_ms": 5000,
//  "max_retries": 1, "strategy_table": "config/strategy_table.json",
//  "log_level": "info"}
bool LoadPollConfigFromText(std::string_view json_text, PollConfig& config, std::string& error);

bool LoadPollConfigFromFile(const std::filesystem::path& path, PollConfig& config,
                            std::string& error);

} // namespace modemstat::poll
