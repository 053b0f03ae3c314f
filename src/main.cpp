#include "remotegate/cli/commands.hpp"

int main(int argc, char **argv) { return remotegate::cli::run_cli(argc, argv); }
