#include "Config.hpp"
#include "Path.hpp"
#include <iostream>
#include <stdexcept>

ShellConfig parseArgs(int argc, const char* const* argv) {
    ShellConfig cfg;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--home") {
            if (i + 1 >= argc) throw std::invalid_argument("--home requires a path");
            cfg.homePath = argv[++i];
            if (!isAbsolutePath(cfg.homePath) || splitPath(cfg.homePath).empty())
                throw std::invalid_argument("--home expects an absolute path below /");
            cfg.createHome = true;
        }
        else if (a == "--no-home") cfg.createHome = false;
        else if (a == "--events")  cfg.echoEvents = true;
        else if (a == "--help" || a == "-h") cfg.showHelp = true;
        else throw std::invalid_argument("unknown option: " + a);
    }
    return cfg;
}

void printUsage(const char* prog) {
    std::cout << "usage: " << prog << " [--home <path>] [--no-home] [--events] [--help]\n"
              << "  --home <path>  директория для '~' (по умолчанию /home)\n"
              << "  --no-home      не создавать домашнюю директорию, '~' считается обычным именем\n"
              << "  --events       печатать события изменения дерева\n";
}
