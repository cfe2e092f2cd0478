#pragma once

namespace sprig::cli {

// Handler receives the subcommand as argv[0] followed by its arguments.
using command_fn = int (*)(int argc, char **argv);

} // namespace sprig::cli
