#include "FileContent.hpp"

void FileContent::append(const std::string& s) {
    data_.insert(data_.end(), s.begin(), s.end());
}

static bool isContinuationByte(std::uint8_t b) { return (b & 0xC0) == 0x80; }

std::string FileContent::preview(std::size_t maxChars) const {
    std::size_t chars = 0;
    std::size_t cut = 0;
    for (; cut < data_.size(); ++cut) {
        if (isContinuationByte(data_[cut])) continue;
        if (chars == maxChars) break;
        ++chars;
    }
    if (cut == data_.size()) return asText();
    std::string out(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(cut));
    out += "...";
    return out;
}
