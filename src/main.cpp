#include "cursorhist/cli/commands.hpp"

int main(int argc, char **argv) { return cursorhist::cli::run_cli(argc, argv); }
