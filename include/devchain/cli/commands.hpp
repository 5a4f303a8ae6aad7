#pragma once

namespace devchain::cli {

int run_cli(int argc, char **argv);

} // namespace devchain::cli
