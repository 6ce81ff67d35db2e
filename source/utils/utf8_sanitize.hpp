#ifndef WEBPUPPET_MCP_UTF8_SANITIZE_HPP
#define WEBPUPPET_MCP_UTF8_SANITIZE_HPP

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 (bad lead bytes, truncated or overlong sequences,
// surrogates) with U+FFFD. Page text must pass through here before it is
// placed in a JSON document, since serialization rejects invalid UTF-8.
std::string sanitize(const std::string &text);

// Cuts text to at most max_bytes without splitting a code point.
// Appends "..." when anything was removed.
std::string truncate(const std::string &text, std::size_t max_bytes);

} // namespace utf8_sanitize

#endif // WEBPUPPET_MCP_UTF8_SANITIZE_HPP
