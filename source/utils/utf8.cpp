#include "utils/utf8.hpp"

#include <utility>

namespace utf8 {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

// Returns number of bytes announced by a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// The byte after some lead bytes has a narrower range than 0x80..0xBF
// (rules out overlong forms, UTF-16 surrogates and code points above U+10FFFF).
bool second_byte_in_range(unsigned char lead, unsigned char second) {
    switch (lead) {
    case 0xE0u:
        return second >= 0xA0u && second <= 0xBFu;
    case 0xEDu:
        return second >= 0x80u && second <= 0x9Fu;
    case 0xF0u:
        return second >= 0x90u && second <= 0xBFu;
    case 0xF4u:
        return second >= 0x80u && second <= 0x8Fu;
    default:
        return is_continuation(second);
    }
}

// Length of the valid sequence starting at pointer, or 0 if it is not valid.
size_t valid_sequence_length(const unsigned char *pointer, const unsigned char *end) {
    unsigned char length = utf8_lead_length(*pointer);
    if (length == 0 || pointer + length > end) {
        return 0;
    }
    if (length > 1 && !second_byte_in_range(pointer[0], pointer[1])) {
        return 0;
    }
    for (unsigned char index = 2; index < length; ++index) {
        if (!is_continuation(pointer[index])) {
            return 0;
        }
    }
    return length;
}

} // namespace

void sanitize(std::string &text) {
    std::string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = valid_sequence_length(pointer, end);
        if (length == 0) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

size_t count_code_points(const std::string &text) {
    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    size_t count = 0;
    while (pointer < end) {
        size_t length = valid_sequence_length(pointer, end);
        pointer += (length == 0) ? 1 : length;
        ++count;
    }
    return count;
}

} // namespace utf8
