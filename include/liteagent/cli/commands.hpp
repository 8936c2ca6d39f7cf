#pragma once

namespace liteagent::cli {

/// Entry point for the liteagent-sandbox binary; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace liteagent::cli
