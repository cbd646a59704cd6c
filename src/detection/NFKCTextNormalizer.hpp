#pragma once

#include "ITextNormalizer.hpp"

namespace detection
{

// Line endings + Unicode NFKC, so full-width OCR output ("Ａｃｃｔ：") reads as ASCII.
class NFKCTextNormalizer : public ITextNormalizer
{
public:
    NFKCTextNormalizer() = default;

    NFKCTextNormalizer(const NFKCTextNormalizer&) = delete;
    NFKCTextNormalizer& operator=(const NFKCTextNormalizer&) = delete;

    [[nodiscard]] std::string normalizeLineEndings(std::string_view text) const override;
    [[nodiscard]] std::string normalize(std::string_view text) const override;
};

} // namespace detection
