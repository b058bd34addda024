#include "CliCommands.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return swisspair::cli::RunCommand(args, std::cout, std::cerr);
}
