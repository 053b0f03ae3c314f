#pragma once

namespace remotegate::cli {

int run_cli(int argc, char **argv);

} // namespace remotegate::cli
