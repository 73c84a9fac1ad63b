#include <lrcalc/cli.hpp>

#include <iostream>

#include <unistd.h>

int main(int argc, char* argv[]) {
    return lrcalc::run_cli(argc, argv, std::cin, std::cout, std::cerr, isatty(0) != 0);
}
