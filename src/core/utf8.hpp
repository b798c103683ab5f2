#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace splash {

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

void append_utf8(std::string& out, uint32_t cp);

// Malformed sequences decode to U+FFFD, one per offending byte.
std::vector<uint32_t> decode_utf8(std::string_view text);

}
