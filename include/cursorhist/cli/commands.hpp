#pragma once

namespace cursorhist::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace cursorhist::cli
