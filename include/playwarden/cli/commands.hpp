#pragma once

namespace playwarden::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace playwarden::cli
