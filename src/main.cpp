#include "rpn2tex/cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return rpn2tex::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
