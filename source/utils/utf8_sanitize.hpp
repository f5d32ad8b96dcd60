#ifndef AMCPS_UTF8_SANITIZE_HPP
#define AMCPS_UTF8_SANITIZE_HPP

// Text that came from outside (backend output, parser error messages that
// quote the offending bytes) must be valid UTF-8 before nlohmann::json will
// serialize it.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 sequences (stray continuation bytes, truncated or
// overlong sequences, surrogates) with U+FFFD. In-place version.
void sanitize(std::string &text);

// Same, returning a new string.
std::string sanitize(const std::string &text);

// Sanitized copy cut to at most max_bytes bytes (never inside a code point),
// with "..." appended when something was dropped. For log lines.
std::string snippet(const std::string &text, std::size_t max_bytes);

} // namespace utf8_sanitize

#endif // AMCPS_UTF8_SANITIZE_HPP
