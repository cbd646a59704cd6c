#pragma once

#include "LabelVocabulary.hpp"

#include <string>
#include <string_view>

namespace detection
{

// Per-signal contributions, so a score can be explained line by line.
struct ConfidenceBreakdown
{
    double vocabulary = 0.0;  // label contains a known phrase
    double value = 0.0;       // value length plausible
    double label_shape = 0.0; // label capitalized or all caps
    double colon = 0.0;       // label carries a colon
    double total = 0.0;       // sum, capped at 1.0
    std::string matched_phrase;
};

class ConfidenceScorer
{
public:
    static constexpr double kVocabularyWeight = 0.4;
    static constexpr double kValueWeight = 0.3;
    static constexpr double kLabelShapeWeight = 0.2;
    static constexpr double kColonWeight = 0.1;

    explicit ConfidenceScorer(const LabelVocabulary& vocabulary);

    [[nodiscard]] ConfidenceBreakdown breakdown(std::string_view label, std::string_view value) const;
    [[nodiscard]] double score(std::string_view label, std::string_view value) const;

    // Strictly above threshold; sums like 0.4 + 0.1 compare equal to 0.5.
    [[nodiscard]] static bool passes(double confidence, double threshold) noexcept;

    // Trimmed length strictly between 2 and 100 code points.
    [[nodiscard]] static bool isValidValue(std::string_view value);
    [[nodiscard]] static bool looksLikeLabel(std::string_view label) noexcept;

private:
    const LabelVocabulary& vocabulary_;
};

} // namespace detection
