#include "cli/cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        fcsandbox::CLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
