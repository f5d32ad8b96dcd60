#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at text[position], or 0.
// Follows the table in Unicode 15, section 3.9 (D92).
std::size_t sequence_length(const std::string &text, std::size_t position) {
    const auto byte_at = [&text](std::size_t index) {
        return static_cast<unsigned char>(text[index]);
    };
    const std::size_t remaining = text.size() - position;
    const unsigned char lead = byte_at(position);

    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;
    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) {
            second_low = 0xA0u;
        } else if (lead == 0xEDu) {
            second_high = 0x9Fu;
        }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) {
            second_low = 0x90u;
        } else if (lead == 0xF4u) {
            second_high = 0x8Fu;
        }
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    const unsigned char second = byte_at(position + 1);
    if (second < second_low || second > second_high) {
        return 0;
    }
    for (std::size_t offset = 2; offset < length; ++offset) {
        const unsigned char continuation = byte_at(position + offset);
        if (continuation < 0x80u || continuation > 0xBFu) {
            return 0;
        }
    }
    return length;
}

} // namespace

void sanitize(std::string &text) {
    std::string cleaned;
    cleaned.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(text, position);
        if (length == 0) {
            cleaned += kReplacement;
            ++position;
            continue;
        }
        cleaned.append(text, position, length);
        position += length;
    }

    text.swap(cleaned);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

std::string snippet(const std::string &text, std::size_t max_bytes) {
    std::string cleaned = sanitize(text);
    if (cleaned.size() <= max_bytes) {
        return cleaned;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    cleaned.resize(cut);
    cleaned += "...";
    return cleaned;
}

} // namespace utf8_sanitize
