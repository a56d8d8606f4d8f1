#include "Format.hpp"
#include <array>
#include <cstdio>

std::string formatSize(std::size_t bytes) {
    static const std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    char buf[64];
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%.2f %s", size, unit);
            return buf;
        }
        size /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.2f TB", size);
    return buf;
}

std::string formatTime(std::time_t t) {
    std::tm tm{};
    if (const std::tm* lt = std::localtime(&t)) tm = *lt;
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return "?";
    return buf;
}
