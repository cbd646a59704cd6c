#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace detection
{

/// Strip leading/trailing ASCII whitespace (space, \t, \r, \n, \f, \v)
[[nodiscard]] std::string trim(std::string_view text);

/// Unicode-aware lowercase of a UTF-8 string; invalid bytes are copied through
[[nodiscard]] std::string to_lower_utf8(std::string_view text);

/// Number of code points; each invalid byte counts as one
[[nodiscard]] std::size_t codepoint_length(std::string_view text);

/// Longest prefix of at most max_bytes bytes that does not split a UTF-8 sequence
[[nodiscard]] std::string_view truncate_utf8_bytes(std::string_view text, std::size_t max_bytes);

/// Prefix holding at most max_codepoints code points
[[nodiscard]] std::string_view truncate_codepoints(std::string_view text, std::size_t max_codepoints);

[[nodiscard]] bool contains(std::string_view haystack, std::string_view needle) noexcept;
[[nodiscard]] bool starts_with(std::string_view text, std::string_view prefix) noexcept;
[[nodiscard]] bool ends_with(std::string_view text, std::string_view suffix) noexcept;

} // namespace detection
