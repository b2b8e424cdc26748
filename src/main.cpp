#include "cairn/cli/commands.hpp"

int main(int argc, char **argv) { return cairn::cli::run_cli(argc, argv); }
