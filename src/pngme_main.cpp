#include "cli/commands.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return pngme::run_cli(argc, argv, std::cout, std::cerr);
}
