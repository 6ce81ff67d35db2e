#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

// Length of the well-formed sequence starting at position, or 0.
// Follows the table in Unicode 15, section 3.9 (D92).
std::size_t sequence_length(const std::string &text, std::size_t position) {
    const std::size_t remaining = text.size() - position;
    const auto byte_at = [&](std::size_t offset) {
        return static_cast<unsigned char>(text[position + offset]);
    };

    unsigned char lead = byte_at(0);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80;
    unsigned char second_high = 0xBF;
    if (in_range(lead, 0xC2, 0xDF)) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        second_low = 0xA0;
    } else if (lead == 0xED) {
        length = 3;
        second_high = 0x9F;
    } else if (in_range(lead, 0xE1, 0xEF)) {
        length = 3;
    } else if (lead == 0xF0) {
        length = 4;
        second_low = 0x90;
    } else if (lead == 0xF4) {
        length = 4;
        second_high = 0x8F;
    } else if (in_range(lead, 0xF1, 0xF3)) {
        length = 4;
    } else {
        return 0;
    }

    if (remaining < length || !in_range(byte_at(1), second_low, second_high)) {
        return 0;
    }
    for (std::size_t offset = 2; offset < length; ++offset) {
        if (!in_range(byte_at(offset), 0x80, 0xBF)) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string sanitize(const std::string &text) {
    std::string result;
    result.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(text, position);
        if (length == 0) {
            result += kReplacement;
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }
    return result;
}

std::string truncate(const std::string &text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    // Back up over continuation bytes so the cut lands on a lead byte.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

} // namespace utf8_sanitize
