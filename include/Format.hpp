#pragma once
#include <cstddef>
#include <ctime>
#include <string>

// "12.00 B", "1.50 KB", ... шаг 1024, до TB
std::string formatSize(std::size_t bytes);

// локальное время, YYYY-MM-DD HH:MM:SS
std::string formatTime(std::time_t t);
