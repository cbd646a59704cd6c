#pragma once

#include "DetectionConfig.hpp"
#include "ITextNormalizer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace detection
{

struct SanitizeReport
{
    std::size_t input_bytes = 0;     // size of the raw input
    bool text_truncated = false;     // total-size cap applied
    std::size_t lines_total = 0;     // lines after splitting, before the line cap
    std::size_t lines_dropped = 0;   // lines removed by the line cap
    std::size_t lines_shortened = 0; // lines cut by the per-line cap
};

struct SanitizedText
{
    // Trimmed, length-capped lines. Blank lines are kept as empty strings so that
    // index + 1 is the line number in the input.
    std::vector<std::string> lines;
    SanitizeReport report;
};

// Bounds arbitrary OCR text before any regex sees it. Never fails: oversized
// input is truncated with a logged warning and processing continues.
class InputSanitizer
{
public:
    InputSanitizer(const DetectionConfig& config, const ITextNormalizer& normalizer);

    [[nodiscard]] SanitizedText sanitize(std::string_view raw_text) const;

private:
    std::string capText(std::string_view text, SanitizeReport& report) const;
    static std::vector<std::string> splitLines(const std::string& text);

    DetectionConfig config_;
    const ITextNormalizer& normalizer_;
};

} // namespace detection
