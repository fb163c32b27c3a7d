#include "poll/poll_config.hpp"

#include "core/json_dom.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <utility>

namespace modemstat::poll {

namespace {

using JsonValue = core::json::Value;

constexpr std::int64_t kMaxTimeoutMs = 60'000;
constexpr std::int64_t kMaxRetries = 5;
constexpr std::int64_t kMaxPollIntervalS = 86'400;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool ReadInteger(const JsonValue& value, std::int64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value || std::fabs(floored) > 1e15) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

bool ApplyInteger(const JsonValue& root, std::string_view key, std::int64_t& target,
                  std::string& error) {
  const JsonValue* member = root.Find(key);
  if (member == nullptr) {
    return true;
  }
  if (!ReadInteger(*member, target)) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  return true;
}

bool ApplyString(const JsonValue& root, std::string_view key, std::string& target,
                 std::string& error) {
  const JsonValue* member = root.Find(key);
  if (member == nullptr) {
    return true;
  }
  if (!member->IsString()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  target = member->string_value;
  return true;
}

void ValidateHost(const std::string& host, ConfigReport& report) {
  if (host.empty()) {
    AddIssue(report, "host", "must not be empty");
    return;
  }
  if (host.find("://") != std::string::npos) {
    AddIssue(report, "host", "must be a bare host name or address without a scheme");
    return;
  }
  if (host.find('/') != std::string::npos) {
    AddIssue(report, "host", "must not include a path");
    return;
  }
  if (std::any_of(host.begin(), host.end(),
                  [](unsigned char c) { return std::isspace(c) != 0; })) {
    AddIssue(report, "host", "must not contain whitespace");
  }
}

} // namespace

ConfigReport ValidatePollConfig(const PollConfig& config) {
  ConfigReport report;
  ValidateHost(config.host, report);

  if (config.port < 1 || config.port > 65535) {
    AddIssue(report, "port", "must be in 1..65535");
  }
  if (config.poll_interval_s <= 0) {
    AddIssue(report, "poll_interval_s", "must be greater than 0");
  } else if (config.poll_interval_s > kMaxPollIntervalS) {
    AddIssue(report, "poll_interval_s", "must be at most 86400 (1 day)");
  }
  if (config.timeout_ms <= 0) {
    AddIssue(report, "timeout_ms", "must be greater than 0");
  } else if (config.timeout_ms > kMaxTimeoutMs) {
    AddIssue(report, "timeout_ms", "must be at most 60000 (60 s)");
  } else if (config.poll_interval_s > 0 && config.poll_interval_s <= kMaxPollIntervalS &&
             config.timeout_ms > config.poll_interval_s * 1000) {
    AddIssue(report, "timeout_ms", "must not exceed the poll interval");
  }
  if (config.max_retries < 0 || config.max_retries > kMaxRetries) {
    AddIssue(report, "max_retries", "must be in 0..5");
  }

  report.valid = report.issues.empty();
  return report;
}

std::string FormatConfigIssues(const ConfigReport& report) {
  std::string formatted;
  for (const ConfigIssue& issue : report.issues) {
    if (!formatted.empty()) {
      formatted += "; ";
    }
    formatted += issue.path + ": " + issue.message;
  }
  return formatted;
}

bool LoadPollConfigFromText(std::string_view json_text, PollConfig& config, std::string& error) {
  error.clear();
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "config root must be a JSON object";
    return false;
  }

  PollConfig updated = config;
  if (!ApplyString(root, "host", updated.host, error) ||
      !ApplyInteger(root, "port", updated.port, error) ||
      !ApplyInteger(root, "poll_interval_s", updated.poll_interval_s, error) ||
      !ApplyInteger(root, "timeout_ms", updated.timeout_ms, error) ||
      !ApplyInteger(root, "max_retries", updated.max_retries, error) ||
      !ApplyString(root, "strategy_table", updated.strategy_table_path, error)) {
    return false;
  }

  if (const JsonValue* level = root.Find("log_level"); level != nullptr) {
    if (!level->IsString()) {
      error = "log_level must be a string";
      return false;
    }
    if (!core::logging::ParseLogLevel(level->string_value, updated.log_level, error)) {
      return false;
    }
  }

  config = std::move(updated);
  return true;
}

bool LoadPollConfigFromFile(const std::filesystem::path& path, PollConfig& config,
                            std::string& error) {
  error.clear();
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (!LoadPollConfigFromText(text, config, error)) {
    error = "failed to load config '" + path.string() + "': " + error;
    return false;
  }
  return true;
}

} // namespace modemstat::poll
