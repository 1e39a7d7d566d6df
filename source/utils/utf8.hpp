#ifndef FMCPS_UTF8_HPP
#define FMCPS_UTF8_HPP

#include <cstddef>
#include <string>

namespace utf8 {

// Replaces invalid UTF-8 sequences (broken multibyte, overlong forms, surrogates,
// invalid bytes) with U+FFFD, in place.
void sanitize(std::string &text);

// Number of Unicode code points in text. Each invalid byte counts as one.
std::size_t count_code_points(const std::string &text);

} // namespace utf8

#endif // FMCPS_UTF8_HPP
