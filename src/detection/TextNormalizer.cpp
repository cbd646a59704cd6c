#include "TextNormalizer.hpp"

namespace detection
{

std::string normalize_line_endings(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // \r\n and lone \r both become a single \n
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string LineEndingNormalizer::normalizeLineEndings(std::string_view text) const
{
    return normalize_line_endings(text);
}

std::string LineEndingNormalizer::normalize(std::string_view text) const
{
    return normalize_line_endings(text);
}

} // namespace detection
