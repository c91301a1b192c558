#include "memroute/cli/commands.hpp"

int main(int argc, char **argv) { return memroute::cli::run_cli(argc, argv); }
