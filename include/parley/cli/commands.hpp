#pragma once

namespace parley::cli {

int run_cli(int argc, char **argv);

} // namespace parley::cli
