#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace gardener::cli {

[[nodiscard]] std::string version_string();

/// Entry point of the `gardener` executable; returns the process exit code.
int run_cli(int argc, char **argv);

/// Same as run_cli over pre-split arguments (without the program name),
/// writing to the given streams.
int run_command(std::vector<std::string> args, std::ostream &out, std::ostream &err);

} // namespace gardener::cli
