#include "devchain/cli/commands.hpp"

int main(int argc, char **argv) { return devchain::cli::run_cli(argc, argv); }
