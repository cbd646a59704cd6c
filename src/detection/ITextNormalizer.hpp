#pragma once

#include <string>
#include <string_view>

namespace detection
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Converts \r\n and \r to \n
    [[nodiscard]] virtual std::string normalizeLineEndings(std::string_view text) const = 0;

    // Full normalization applied before splitting into lines. Must never merge or
    // drop newlines, since line numbers are reported against the result.
    [[nodiscard]] virtual std::string normalize(std::string_view text) const = 0;
};

} // namespace detection
