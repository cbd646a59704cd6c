#pragma once

#include "ITextNormalizer.hpp"

#include <string>
#include <string_view>

namespace detection
{

[[nodiscard]] std::string normalize_line_endings(std::string_view text);

// Line endings only; used when Unicode normalization is switched off.
class LineEndingNormalizer : public ITextNormalizer
{
public:
    [[nodiscard]] std::string normalizeLineEndings(std::string_view text) const override;
    [[nodiscard]] std::string normalize(std::string_view text) const override;
};

} // namespace detection
