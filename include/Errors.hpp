#pragma once
#include <map>
#include <string>
#include <stdexcept>
#include <iostream>

enum class ErrorCode {
    DuplicateName,
    NotFound,
    WrongKind,
    RootViolation,
    InvalidName
};

inline const std::map<ErrorCode, std::string> g_errorTable = {
    {ErrorCode::DuplicateName, "Имя уже занято в этой директории"},
    {ErrorCode::NotFound,      "Файл или директория не найдены"},
    {ErrorCode::WrongKind,     "Операция неприменима к узлу этого типа"},
    {ErrorCode::RootViolation, "Операция запрещена с корневым узлом"},
    {ErrorCode::InvalidName,   "Недопустимое имя"}
};

class VfsException : public std::runtime_error {
public:
    ErrorCode code;
    std::string detail; // путь или имя, на котором споткнулись

    explicit VfsException(ErrorCode code)
        : std::runtime_error(g_errorTable.at(code)), code(code) {}

    VfsException(ErrorCode code, const std::string& detail)
        : std::runtime_error(g_errorTable.at(code) + ": " + detail), code(code), detail(detail) {}
};

inline void throwIf(bool cond, ErrorCode code) {
    if (cond) throw VfsException(code);
}

inline void throwIf(bool cond, ErrorCode code, const std::string& detail) {
    if (cond) throw VfsException(code, detail);
}

inline void handleException(const VfsException& ex, std::ostream& err = std::cerr) {
    err << "Ошибка: " << ex.what() << "\n";
}
