#include "playwarden/cli/commands.hpp"

int main(int argc, char **argv) { return playwarden::cli::run_cli(argc, argv); }
