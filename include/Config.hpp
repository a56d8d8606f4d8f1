#pragma once
#include <string>

struct ShellConfig {
    std::string homePath = "/home"; // якорь для "~", создаётся при старте
    bool createHome = true;
    bool echoEvents = false;        // печатать события шины
    bool showHelp = false;
};

// Разбор argv. Неизвестный флаг или флаг без значения -> std::invalid_argument.
ShellConfig parseArgs(int argc, const char* const* argv);

void printUsage(const char* prog);
