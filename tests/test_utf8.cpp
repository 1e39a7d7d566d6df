// Tests for the UTF-8 helpers used to keep tool output valid JSON text.

#include "utils/utf8.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <string>

using test_support::check;
using test_support::check_equal;

namespace test_utf8 {

static const std::string kReplacement = "\xEF\xBF\xBD";

// Test: Valid text is left unchanged.
static bool test_sanitize_keeps_valid_text() {
    const std::string original = "plain ascii, h\xC3\xA9llo, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    std::string text = original;
    utf8::sanitize(text);
    return check_equal(text, original, "Valid UTF-8 is unchanged");
}

// Test: Invalid bytes, truncated sequences and surrogates are replaced.
static bool test_sanitize_replaces_invalid_sequences() {
    std::string invalid_byte = "a\xFF" "b";
    std::string truncated = "x\xE2\x82";
    std::string surrogate = "\xED\xA0\x80";
    std::string overlong = "\xC0\xAF";

    utf8::sanitize(invalid_byte);
    utf8::sanitize(truncated);
    utf8::sanitize(surrogate);
    utf8::sanitize(overlong);

    bool passed = check_equal(invalid_byte, "a" + kReplacement + "b", "Invalid byte is replaced");
    passed &= check_equal(truncated, "x" + kReplacement + kReplacement, "Truncated sequence is replaced");
    passed &= check_equal(surrogate, kReplacement + kReplacement + kReplacement, "Encoded surrogate is replaced");
    passed &= check_equal(overlong, kReplacement + kReplacement, "Overlong form is replaced");
    return passed;
}

// Test: Sanitized text can always be serialized by nlohmann/json.
static bool test_sanitized_text_serializes() {
    std::string text = "\x80\x81 binary \xFE\xFF \xF4\x90\x80\x80";
    utf8::sanitize(text);

    bool serialized = true;
    try {
        nlohmann::json value = text;
        (void)value.dump();
    } catch (const nlohmann::json::type_error &) {
        serialized = false;
    }
    return check(serialized, "Sanitized binary data serializes as JSON");
}

// Test: Code points are counted, not bytes.
static bool test_count_code_points() {
    bool passed = check(utf8::count_code_points("") == 0, "Empty string has 0 code points");
    passed &= check(utf8::count_code_points("hello") == 5, "ASCII counts one per byte");
    passed &= check(utf8::count_code_points("h\xC3\xA9llo") == 5, "Two-byte sequence counts once");
    passed &= check(utf8::count_code_points("\xF0\x9F\x98\x80!") == 2, "Four-byte sequence counts once");
    return passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_sanitize_keeps_valid_text();
    all_passed &= test_sanitize_replaces_invalid_sequences();
    all_passed &= test_sanitized_text_serializes();
    all_passed &= test_count_code_points();
    return all_passed;
}

} // namespace test_utf8
