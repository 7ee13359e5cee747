#pragma once

namespace auraseal::cli {

// Returns the process exit code: 0 on success, 1 on error, 2 when a
// package was processed but some components failed.
int run(int argc, char** argv);

} // namespace auraseal::cli
