#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/modem_fixtures.hpp"

#include <string>
#include <vector>

namespace {

using modemstat::tests::common::AssertContains;
using modemstat::tests::common::CapturedDispatch;
using modemstat::tests::common::DispatchCaptured;
using modemstat::tests::common::Fail;

CapturedDispatch ExpectExit(const std::vector<std::string>& argv, int expected_exit,
                            std::string_view expected_stderr) {
  const CapturedDispatch run = DispatchCaptured(argv);
  if (run.exit_code != expected_exit) {
    Fail("unexpected exit code " + std::to_string(run.exit_code) + " for '" + argv.back() +
         "'; stderr: " + run.err);
  }
  if (!expected_stderr.empty()) {
    AssertContains(run.err, expected_stderr);
  }
  return run;
}

} // namespace

int main() {
  {
    const auto run = ExpectExit({"modemstat", "version"}, 0, "");
    AssertContains(run.out, "modemstat 0.1.0");
  }
  ExpectExit({"modemstat", "version", "--verbose"}, 2, "does not accept arguments");
  ExpectExit({"modemstat"}, 2, "usage:");
  {
    const auto run = ExpectExit({"modemstat", "help"}, 0, "");
    AssertContains(run.out, "modemstat poll [--host <host>]");
    AssertContains(run.out, "modemstat watch [poll options] [--interval-s <n>] [--count <n>]");
  }
  ExpectExit({"modemstat", "scan"}, 2, "unknown subcommand: scan");

  // Argument errors are usage errors.
  ExpectExit({"modemstat", "poll", "--port", "eighty"}, 2, "invalid integer for --port: eighty");
  ExpectExit({"modemstat", "poll", "--host"}, 2, "missing value for --host");
  ExpectExit({"modemstat", "poll", "--log-level", "loud"}, 2, "invalid log level 'loud'");
  ExpectExit({"modemstat", "watch", "--count", "-1"}, 2, "--count must be >= 0");
  ExpectExit({"modemstat", "probe", "--retries", "2"}, 2, "unknown option: --retries");
  ExpectExit({"modemstat", "poll", "--interval-s", "10"}, 2, "unknown option: --interval-s");

  // Configuration errors are rejected before any device traffic.
  ExpectExit({"modemstat", "poll", "--host", "http://192.168.100.1"}, 10,
             "host: must be a bare host name or address without a scheme");
  ExpectExit({"modemstat", "probe", "--port", "70000"}, 10, "port: must be in 1..65535");
  ExpectExit({"modemstat", "watch", "--interval-s", "2", "--timeout-ms", "5000"}, 10,
             "timeout_ms: must not exceed the poll interval");

  const modemstat::tests::common::ScratchDir scratch("cli");
  const std::string missing = scratch.PathOf("missing.json").string();
  ExpectExit({"modemstat", "poll", "--config", missing}, 10, "failed to open config file");

  {
    auto config_path = scratch.Write("modemstat.json", R"({"timeout_ms": 99999})");
    ExpectExit({"modemstat", "poll", "--config", config_path.string()}, 10,
               "timeout_ms: must be at most 60000");
    // Flags override file values.
    config_path = scratch.Write("modemstat.json", R"({"host": "modem.local", "port": 0})");
    ExpectExit({"modemstat", "poll", "--config", config_path.string(), "--port", "99999"}, 10,
               "port: must be in 1..65535");
  }

  ExpectExit({"modemstat", "poll", "--strategy-table", missing}, 10,
             "failed to open strategy table file");

  {
    auto table_path =
        scratch.Write("table.json", R"({"endpoints": [{"id": "page", "path": "/", "shape": "html"}]})");
    const auto run =
        ExpectExit({"modemstat", "endpoints", "--strategy-table", table_path.string()}, 0,
                   "strategy table: ");
    AssertContains(run.out, R"("id":"page")");
    AssertContains(run.out, R"("shape":"html_status_table")");

    table_path = scratch.Write("table.json", R"({"endpoints": []})");
    ExpectExit({"modemstat", "endpoints", "--strategy-table", table_path.string()}, 1,
               "at least one endpoint");
  }
  ExpectExit({"modemstat", "endpoints", "--bogus"}, 2, "unknown option: --bogus");

  return 0;
}
