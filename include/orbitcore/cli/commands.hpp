#pragma once

namespace orbitcore::cli {

/// Entry point for the `orbitcore` binary; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace orbitcore::cli
