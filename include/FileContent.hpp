#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Opaque text payload of a file node. Size is always the byte length.
class FileContent {
public:
    using byte = std::uint8_t;

    std::size_t size() const noexcept { return data_.size(); }

    void append(const std::string& s);

    // Text sugar
    void assignText(const std::string& s) { data_.assign(s.begin(), s.end()); }
    std::string asText() const { return std::string(data_.begin(), data_.end()); }
    // первые maxChars символов UTF-8 и "...", если текст длиннее
    std::string preview(std::size_t maxChars) const;

private:
    std::vector<byte> data_;
};
