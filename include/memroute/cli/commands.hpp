#pragma once

namespace memroute::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace memroute::cli
