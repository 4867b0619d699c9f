#include "names.hpp"
#include <cstdint>

namespace idreg {

namespace {
// Length of the sequence introduced by a lead byte, 0 if it cannot start one.
size_t sequence_length(uint8_t lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

bool is_continuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t length = sequence_length(lead);
        if (length == 0 || i + length > text.size()) {
            return false;
        }

        for (size_t j = 1; j < length; j++) {
            if (!is_continuation(static_cast<uint8_t>(text[i + j]))) {
                return false;
            }
        }

        // Overlongs, surrogates and code points above U+10FFFF
        uint8_t second = length > 1 ? static_cast<uint8_t>(text[i + 1]) : 0;
        if (lead == 0xE0 && second < 0xA0) return false;
        if (lead == 0xED && second > 0x9F) return false;
        if (lead == 0xF0 && second < 0x90) return false;
        if (lead == 0xF4 && second > 0x8F) return false;

        i += length;
    }
    return true;
}

bool is_valid_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    if (name.find_first_of("\r\n") != std::string_view::npos) {
        return false;
    }
    return is_valid_utf8(name);
}

} // namespace idreg
