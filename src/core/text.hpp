#pragma once
#include <cstddef>
#include <string>

namespace pocket::core::text {

// First max_bytes bytes of text, shortened further so a multi-byte UTF-8
// character is never split.
std::string truncate_utf8(const std::string& text, size_t max_bytes);

} // namespace pocket::core::text
