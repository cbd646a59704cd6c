#include "PatternMatcher.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>
#include <stdexcept>

namespace detection
{

namespace
{

constexpr auto kFlags = std::regex_constants::ECMAScript | std::regex_constants::icase |
                        std::regex_constants::optimize;

// Fragment lengths are capped in every pattern (label 200, keyword label 100, value 500)
// so no single application can backtrack without bound.
constexpr const char* kInlineColon = R"(([A-Z][^:\n]{0,200}?):\s*([^\n]{0,500}))";
constexpr const char* kLineBreak = R"(([A-Z][^\n]{0,200}?)\n+([^\n]{0,500}))";
constexpr const char* kBlankLineSeparated = R"(([A-Z][^\n]{0,200}?)\n\n+([^\n]{0,500}))";

inline std::string escape_regex(const std::string& s)
{
    static const std::string special = R"(\.^$|()[]*+?{}-)";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s)
    {
        if (special.find(c) != std::string::npos)
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string keywordPattern(const std::vector<std::string>& keywords)
{
    std::string alternation;
    for (const auto& keyword : keywords)
    {
        if (!alternation.empty())
            alternation += '|';
        alternation += escape_regex(keyword);
    }
    // Anchored: the line must open with the keyword. Colons are excluded from the label,
    // so this form only fires when OCR dropped the separator.
    return "^((?:" + alternation + R"()[^\d:\n]{0,100}?)\s+(\d{4,20}|[A-Z0-9]{8,30}))";
}

PatternDefinition makeDefinition(std::string name, PatternForm form, std::string source)
{
    PatternDefinition def;
    def.name = std::move(name);
    def.form = form;
    def.compiled = std::regex(source, kFlags);
    def.source = std::move(source);
    return def;
}

MatchOutcome regexSearch(const PatternDefinition& pattern, const std::string& subject)
{
    std::smatch match;
    if (!std::regex_search(subject, match, pattern.compiled) || match.size() < 3)
        return MatchOutcome::noMatch();

    if (!match[1].matched || !match[2].matched)
        return MatchOutcome::noMatch();

    std::string label = trim(match[1].str());
    std::string value = trim(match[2].str());
    if (label.empty() || value.empty())
        return MatchOutcome::noMatch();

    return MatchOutcome::matched(std::move(label), std::move(value));
}

} // namespace

const char* toString(PatternForm form) noexcept
{
    switch (form)
    {
    case PatternForm::InlineColon:
        return "inline_colon";
    case PatternForm::InlineKeyword:
        return "inline_keyword";
    case PatternForm::LineBreak:
        return "line_break";
    case PatternForm::BlankLineSeparated:
        return "blank_line_separated";
    }
    return "unknown";
}

PatternSet::PatternSet(const LabelVocabulary& vocabulary)
{
    definitions_.push_back(makeDefinition("inline_colon", PatternForm::InlineColon, kInlineColon));
    if (!vocabulary.structuralKeywords().empty())
    {
        definitions_.push_back(makeDefinition("inline_keyword", PatternForm::InlineKeyword,
                                              keywordPattern(vocabulary.structuralKeywords())));
    }
    definitions_.push_back(makeDefinition("line_break", PatternForm::LineBreak, kLineBreak));
    definitions_.push_back(
        makeDefinition("blank_line_separated", PatternForm::BlankLineSeparated, kBlankLineSeparated));
}

const PatternSet& PatternSet::defaults()
{
    static const PatternSet patterns(LabelVocabulary::defaults());
    return patterns;
}

const PatternDefinition& PatternSet::get(PatternForm form) const
{
    for (const auto& def : definitions_)
    {
        if (def.form == form)
            return def;
    }
    throw std::out_of_range(std::string("pattern form not registered: ") + toString(form));
}

MatchOutcome MatchOutcome::matched(std::string label, std::string value)
{
    MatchOutcome outcome;
    outcome.status = MatchStatus::Matched;
    outcome.label = std::move(label);
    outcome.value = std::move(value);
    return outcome;
}

MatchOutcome MatchOutcome::noMatch() { return MatchOutcome{}; }

MatchOutcome MatchOutcome::failed(std::string error)
{
    MatchOutcome outcome;
    outcome.status = MatchStatus::Failed;
    outcome.error = std::move(error);
    return outcome;
}

PatternMatcher::PatternMatcher(const PatternSet& patterns, const LabelVocabulary& vocabulary, InlineGate inline_gate)
    : patterns_(patterns)
    , vocabulary_(vocabulary)
    , inline_gate_(std::move(inline_gate))
{
}

MatchOutcome PatternMatcher::apply(const PatternDefinition& pattern, const std::string& subject)
{
    try
    {
        return regexSearch(pattern, subject);
    }
    catch (const std::exception& ex)
    {
        return MatchOutcome::failed(ex.what());
    }
}

MatchOutcome PatternMatcher::search(const PatternDefinition& pattern, const std::string& subject) const
{
    return regexSearch(pattern, subject);
}

MatchOutcome PatternMatcher::attempt(const PatternDefinition& pattern, const std::string& subject) const
{
    try
    {
        return search(pattern, subject);
    }
    catch (const std::exception& ex)
    {
        // regex_error (error_complexity, error_stack) or bad_alloc on hostile input
        return MatchOutcome::failed(ex.what());
    }
}

bool PatternMatcher::isValueLine(std::string_view line) const
{
    std::string lower = to_lower_utf8(trim(line));
    if (lower.empty())
        return false;

    if (ends_with(lower, ":"))
        return false;

    return !vocabulary_.startsWithPhrase(lower);
}

std::vector<Candidate> PatternMatcher::match(const std::vector<std::string>& lines, DetectionStats& stats) const
{
    PROFILE_SCOPE_FUNCTION();
    std::vector<Candidate> candidates;

    // next_non_empty[i]: index of the first non-empty line after i, or lines.size()
    std::vector<std::size_t> next_non_empty(lines.size(), lines.size());
    for (std::size_t i = lines.size(); i-- > 1;)
        next_non_empty[i - 1] = lines[i].empty() ? next_non_empty[i] : i;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string& line = lines[i];
        if (line.empty())
            continue;

        ++stats.lines_processed;
        const std::size_t line_number = i + 1;

        // A line that already carries an accepted value is not the label half of a pair.
        if (matchInline(line, line_number, candidates, stats))
            continue;

        const std::size_t next = next_non_empty[i];
        if (next >= lines.size())
            continue;

        matchMultiline(line, lines[next], next == i + 1, line_number, candidates, stats);
    }

    return candidates;
}

bool PatternMatcher::matchInline(const std::string& line, std::size_t line_number, std::vector<Candidate>& out,
                                 DetectionStats& stats) const
{
    bool found = false;
    for (const auto& pattern : patterns_.definitions())
    {
        if (pattern.form != PatternForm::InlineColon && pattern.form != PatternForm::InlineKeyword)
            continue;

        if (!record(attempt(pattern, line), pattern, line_number, out, stats))
            continue;
        if (!inline_gate_ || inline_gate_(out.back()))
            found = true;
    }
    return found;
}

void PatternMatcher::matchMultiline(const std::string& label_line, const std::string& value_line, bool adjacent,
                                    std::size_t line_number, std::vector<Candidate>& out,
                                    DetectionStats& stats) const
{
    if (!vocabulary_.findPhrase(to_lower_utf8(label_line)))
        return;

    if (!isValueLine(value_line))
        return;

    const PatternForm form = adjacent ? PatternForm::LineBreak : PatternForm::BlankLineSeparated;
    for (const auto& pattern : patterns_.definitions())
    {
        if (pattern.form != form)
            continue;

        std::string subject = label_line;
        subject += adjacent ? "\n" : "\n\n";
        subject += value_line;
        record(attempt(pattern, subject), pattern, line_number, out, stats);
    }
}

bool PatternMatcher::record(const MatchOutcome& outcome, const PatternDefinition& pattern, std::size_t line_number,
                            std::vector<Candidate>& out, DetectionStats& stats) const
{
    ++stats.pattern_attempts;

    switch (outcome.status)
    {
    case MatchStatus::Failed:
        ++stats.pattern_failures;
        PLOG_WARNING << "Error matching pattern '" << pattern.name << "' on line " << line_number << ": "
                     << (outcome.error.empty() ? std::string("unknown error") : outcome.error);
        return false;

    case MatchStatus::NoMatch:
        return false;

    case MatchStatus::Matched:
        break;
    }

    ++stats.candidates;
    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[PatternMatcher] line=" << line_number << " form=" << toString(pattern.form)
            << " label=" << Diagnostics::Preview(outcome.label) << " value=" << Diagnostics::Preview(outcome.value);
    }
    out.push_back(Candidate{ outcome.label, outcome.value, line_number, pattern.form });
    return true;
}

} // namespace detection
