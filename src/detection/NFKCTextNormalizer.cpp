#include "NFKCTextNormalizer.hpp"
#include "TextNormalizer.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace detection
{

std::string NFKCTextNormalizer::normalizeLineEndings(std::string_view text) const
{
    return normalize_line_endings(text);
}

std::string NFKCTextNormalizer::normalize(std::string_view text) const
{
    if (text.empty())
        return std::string();

    std::string line_normalized = normalizeLineEndings(text);

    // utf8proc_NFKC expects a NUL-terminated string; embedded NULs would cut it short.
    if (line_normalized.find('\0') != std::string::npos)
    {
        PLOG_WARNING << "NFKC normalization skipped: input contains NUL bytes";
        return line_normalized;
    }

    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(line_normalized.c_str()));

    if (!normalized)
    {
        PLOG_WARNING << "NFKC normalization failed, falling back to line ending normalization only";
        return line_normalized;
    }

    std::string nfkc_normalized(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return nfkc_normalized;
}

} // namespace detection
