#include "core/text.hpp"

namespace pocket::core::text {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t cut = max_bytes;
    while (cut > 0 && is_continuation(text[cut])) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace pocket::core::text
