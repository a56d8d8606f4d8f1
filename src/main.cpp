#include "Config.hpp"
#include "Errors.hpp"
#include "Shell.hpp"
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    ShellConfig cfg;
    try {
        cfg = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }
    if (cfg.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        Shell shell(cfg);
        shell.run();
    } catch (const VfsException& e) {
        handleException(e);
        return 1;
    }
    return 0;
}
