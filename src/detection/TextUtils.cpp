#include "TextUtils.hpp"
#include <utf8proc.h>

namespace detection
{

namespace
{

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

// Byte length of the code point at `pos`, or 1 for an invalid sequence.
std::size_t sequence_length(std::string_view text, std::size_t pos, utf8proc_int32_t* codepoint)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    utf8proc_ssize_t bytes = utf8proc_iterate(str, static_cast<utf8proc_ssize_t>(text.size() - pos), codepoint);
    if (bytes <= 0)
    {
        *codepoint = -1;
        return 1;
    }
    return static_cast<std::size_t>(bytes);
}

} // namespace

std::string trim(std::string_view text)
{
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return std::string();
    auto last = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string to_lower_utf8(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size())
    {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (c < 0x80)
        {
            result.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : static_cast<char>(c));
            ++pos;
            continue;
        }

        utf8proc_int32_t codepoint = 0;
        std::size_t bytes = sequence_length(text, pos, &codepoint);
        if (codepoint < 0)
        {
            result.push_back(text[pos]);
            pos += bytes;
            continue;
        }

        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t written = utf8proc_encode_char(utf8proc_tolower(codepoint), buffer);
        if (written > 0)
            result.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
        else
            result.append(text.substr(pos, bytes));
        pos += bytes;
    }
    return result;
}

std::size_t codepoint_length(std::string_view text)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        utf8proc_int32_t codepoint = 0;
        pos += sequence_length(text, pos, &codepoint);
        ++count;
    }
    return count;
}

std::string_view truncate_utf8_bytes(std::string_view text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes)
        return text;

    std::size_t cut = max_bytes;
    // Back off over continuation bytes (10xxxxxx) so the cut lands on a lead byte.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut);
}

std::string_view truncate_codepoints(std::string_view text, std::size_t max_codepoints)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size() && count < max_codepoints)
    {
        utf8proc_int32_t codepoint = 0;
        pos += sequence_length(text, pos, &codepoint);
        ++count;
    }
    return text.substr(0, pos);
}

bool contains(std::string_view haystack, std::string_view needle) noexcept
{
    return haystack.find(needle) != std::string_view::npos;
}

bool starts_with(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace detection
