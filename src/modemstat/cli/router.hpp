#pragma once

namespace modemstat::cli {

// Routes `modemstat` subcommands and returns process exit codes with a stable
// contract for schedulers and scripts:
//   0  => success / device healthy
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => poll configuration invalid
//   20 => device unavailable (no field populated)
//   21 => device degraded (partial data)
int Dispatch(int argc, char** argv);

} // namespace modemstat::cli
