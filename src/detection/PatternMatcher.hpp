#pragma once

#include "DetectionTypes.hpp"
#include "LabelVocabulary.hpp"

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace detection
{

// Layout a label/value pair was found in, in priority order.
enum class PatternForm
{
    InlineColon,        // "Label: Value"
    InlineKeyword,      // "Account Number 1234" (colon dropped by OCR)
    LineBreak,          // "Label\nValue"
    BlankLineSeparated  // "Label\n\nValue"
};

[[nodiscard]] const char* toString(PatternForm form) noexcept;

struct PatternDefinition
{
    std::string name;
    PatternForm form;
    std::string source;      // regex text, kept for diagnostics
    std::regex compiled;     // ECMAScript, case-insensitive
};

// Compiled once, read-only afterwards. std::regex is safe for concurrent const use.
class PatternSet
{
public:
    // The keyword alternation of the InlineKeyword form comes from the vocabulary.
    explicit PatternSet(const LabelVocabulary& vocabulary);

    static const PatternSet& defaults();

    [[nodiscard]] const std::vector<PatternDefinition>& definitions() const noexcept { return definitions_; }
    [[nodiscard]] const PatternDefinition& get(PatternForm form) const;

private:
    std::vector<PatternDefinition> definitions_;
};

enum class MatchStatus
{
    Matched,
    NoMatch,
    Failed // matcher threw; treated as no match by callers
};

struct MatchOutcome
{
    MatchStatus status = MatchStatus::NoMatch;
    std::string label; // trimmed, non-empty when Matched
    std::string value; // trimmed, non-empty when Matched
    std::string error; // set when Failed

    static MatchOutcome matched(std::string label, std::string value);
    static MatchOutcome noMatch();
    static MatchOutcome failed(std::string error);
};

struct Candidate
{
    std::string label;
    std::string value;
    std::size_t line_number = 0;
    PatternForm form = PatternForm::InlineColon;
};

class PatternMatcher
{
public:
    // Decides whether an inline candidate keeps its line from being paired with the next
    // line. Without one, any inline candidate does.
    using InlineGate = std::function<bool(const Candidate&)>;

    PatternMatcher(const PatternSet& patterns, const LabelVocabulary& vocabulary, InlineGate inline_gate = {});
    virtual ~PatternMatcher() = default;

    // Proposes candidates for every non-empty line, then for each label line paired with
    // the next non-empty line. Counts attempts and failures into `stats`.
    [[nodiscard]] std::vector<Candidate> match(const std::vector<std::string>& lines, DetectionStats& stats) const;

    // One pattern on one subject. Matcher exceptions become Failed; empty label/value after trimming is NoMatch.
    [[nodiscard]] static MatchOutcome apply(const PatternDefinition& pattern, const std::string& subject);

    // A line that can hold a value: does not end with ':' and does not open with a known label.
    [[nodiscard]] bool isValueLine(std::string_view line) const;

protected:
    // Runs the regex. May throw; match() turns exceptions into Failed outcomes.
    virtual MatchOutcome search(const PatternDefinition& pattern, const std::string& subject) const;

private:
    MatchOutcome attempt(const PatternDefinition& pattern, const std::string& subject) const;
    bool matchInline(const std::string& line, std::size_t line_number, std::vector<Candidate>& out,
                     DetectionStats& stats) const;
    void matchMultiline(const std::string& label_line, const std::string& value_line, bool adjacent,
                        std::size_t line_number, std::vector<Candidate>& out, DetectionStats& stats) const;
    bool record(const MatchOutcome& outcome, const PatternDefinition& pattern, std::size_t line_number,
                std::vector<Candidate>& out, DetectionStats& stats) const;

    const PatternSet& patterns_;
    const LabelVocabulary& vocabulary_;
    InlineGate inline_gate_;
};

} // namespace detection
