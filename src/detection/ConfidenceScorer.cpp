#include "ConfidenceScorer.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace detection
{

namespace
{

constexpr double kEpsilon = 1e-9;

bool isUpperAscii(char c) noexcept { return c >= 'A' && c <= 'Z'; }

bool isSpace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

ConfidenceScorer::ConfidenceScorer(const LabelVocabulary& vocabulary)
    : vocabulary_(vocabulary)
{
}

ConfidenceBreakdown ConfidenceScorer::breakdown(std::string_view label, std::string_view value) const
{
    ConfidenceBreakdown result;

    if (auto phrase = vocabulary_.findPhrase(to_lower_utf8(label)))
    {
        result.vocabulary = kVocabularyWeight;
        result.matched_phrase = std::string(*phrase);
    }

    if (isValidValue(value))
        result.value = kValueWeight;

    if (looksLikeLabel(label))
        result.label_shape = kLabelShapeWeight;

    if (label.find(':') != std::string_view::npos)
        result.colon = kColonWeight;

    double sum = result.vocabulary + result.value + result.label_shape + result.colon;
    result.total = std::clamp(sum, 0.0, 1.0);
    return result;
}

double ConfidenceScorer::score(std::string_view label, std::string_view value) const
{
    return breakdown(label, value).total;
}

bool ConfidenceScorer::passes(double confidence, double threshold) noexcept
{
    return confidence > threshold + kEpsilon;
}

bool ConfidenceScorer::isValidValue(std::string_view value)
{
    std::string trimmed = trim(value);
    if (trimmed.empty())
        return false;

    std::size_t length = codepoint_length(trimmed);
    return length > 2 && length < 100;
}

bool ConfidenceScorer::looksLikeLabel(std::string_view label) noexcept
{
    if (label.empty())
        return false;

    if (isUpperAscii(label.front()))
        return true;

    return std::all_of(label.begin(), label.end(), [](char c) { return isUpperAscii(c) || isSpace(c); });
}

} // namespace detection
