#include <catch2/catch_test_macros.hpp>
#include "detection/PatternMatcher.hpp"

#include <regex>
#include <string>
#include <vector>

using namespace detection;

namespace
{

PatternMatcher defaultMatcher()
{
    return PatternMatcher(PatternSet::defaults(), LabelVocabulary::defaults());
}

// Fails every colon-form search, as std::regex does on pathological input.
class FailingColonMatcher : public PatternMatcher
{
public:
    FailingColonMatcher()
        : PatternMatcher(PatternSet::defaults(), LabelVocabulary::defaults())
    {
    }

protected:
    MatchOutcome search(const PatternDefinition& pattern, const std::string& subject) const override
    {
        if (pattern.form == PatternForm::InlineColon)
            throw std::regex_error(std::regex_constants::error_complexity);
        return PatternMatcher::search(pattern, subject);
    }
};

} // namespace

TEST_CASE("PatternSet - default definitions", "[matcher]")
{
    const auto& patterns = PatternSet::defaults();
    REQUIRE(patterns.definitions().size() == 4);
    REQUIRE(patterns.definitions()[0].form == PatternForm::InlineColon);
    REQUIRE(patterns.get(PatternForm::InlineKeyword).name == "inline_keyword");
    REQUIRE(patterns.get(PatternForm::BlankLineSeparated).source.find("\\n\\n+") != std::string::npos);

    SECTION("Vocabulary without keywords has no keyword form")
    {
        LabelVocabulary vocabulary({ "account number" }, {}, {});
        PatternSet reduced(vocabulary);
        REQUIRE(reduced.definitions().size() == 3);
        REQUIRE_THROWS_AS(reduced.get(PatternForm::InlineKeyword), std::out_of_range);
    }
}

TEST_CASE("PatternMatcher - apply single patterns", "[matcher]")
{
    const auto& patterns = PatternSet::defaults();
    const auto& colon = patterns.get(PatternForm::InlineColon);
    const auto& keyword = patterns.get(PatternForm::InlineKeyword);

    SECTION("Colon form splits label and value")
    {
        auto outcome = PatternMatcher::apply(colon, "Account Number:   1234  ");
        REQUIRE(outcome.status == MatchStatus::Matched);
        REQUIRE(outcome.label == "Account Number");
        REQUIRE(outcome.value == "1234");
    }

    SECTION("Colon form needs a letter to start the label")
    {
        REQUIRE(PatternMatcher::apply(colon, "12: 34").status == MatchStatus::NoMatch);
    }

    SECTION("Empty value is no match")
    {
        REQUIRE(PatternMatcher::apply(colon, "Account Number:").status == MatchStatus::NoMatch);
        REQUIRE(PatternMatcher::apply(colon, "Account Number:    ").status == MatchStatus::NoMatch);
    }

    SECTION("Keyword form handles a dropped colon")
    {
        auto outcome = PatternMatcher::apply(keyword, "Acct # 1234");
        REQUIRE(outcome.status == MatchStatus::Matched);
        REQUIRE(outcome.label == "Acct #");
        REQUIRE(outcome.value == "1234");

        outcome = PatternMatcher::apply(keyword, "IBAN DE89370400440532013000");
        REQUIRE(outcome.status == MatchStatus::Matched);
        REQUIRE(outcome.label == "IBAN");
        REQUIRE(outcome.value == "DE89370400440532013000");
    }

    SECTION("Keyword form is anchored and skips colon lines")
    {
        REQUIRE(PatternMatcher::apply(keyword, "Your account 12345678").status == MatchStatus::NoMatch);
        REQUIRE(PatternMatcher::apply(keyword, "Account Number: 1234").status == MatchStatus::NoMatch);
        REQUIRE(PatternMatcher::apply(keyword, "Account Holder").status == MatchStatus::NoMatch);
    }

    SECTION("Line break forms")
    {
        auto outcome = PatternMatcher::apply(patterns.get(PatternForm::LineBreak), "Account No\n1234");
        REQUIRE(outcome.status == MatchStatus::Matched);
        REQUIRE(outcome.label == "Account No");
        REQUIRE(outcome.value == "1234");

        outcome = PatternMatcher::apply(patterns.get(PatternForm::BlankLineSeparated), "ACCOUNT HOLDER\n\nJohn Smith");
        REQUIRE(outcome.status == MatchStatus::Matched);
        REQUIRE(outcome.label == "ACCOUNT HOLDER");
        REQUIRE(outcome.value == "John Smith");
    }
}

TEST_CASE("PatternMatcher - match over lines", "[matcher]")
{
    auto matcher = defaultMatcher();
    DetectionStats stats;

    SECTION("Forms are reported per candidate")
    {
        std::vector<std::string> lines = { "Institution: Example Bank", "Account No", "1234", "", "ACCOUNT HOLDER", "",
                                           "", "John Smith" };
        auto candidates = matcher.match(lines, stats);

        REQUIRE(candidates.size() == 3);
        REQUIRE(candidates[0].form == PatternForm::InlineColon);
        REQUIRE(candidates[0].line_number == 1);
        REQUIRE(candidates[1].form == PatternForm::LineBreak);
        REQUIRE(candidates[1].line_number == 2);
        REQUIRE(candidates[1].value == "1234");
        REQUIRE(candidates[2].form == PatternForm::BlankLineSeparated);
        REQUIRE(candidates[2].line_number == 5);
        REQUIRE(candidates[2].value == "John Smith");

        REQUIRE(stats.lines_processed == 5);
        REQUIRE(stats.candidates == 3);
        REQUIRE(stats.pattern_failures == 0);
    }

    SECTION("Inline lines are not paired with the next line")
    {
        std::vector<std::string> lines = { "Account Number: 1234", "Example text" };
        auto candidates = matcher.match(lines, stats);
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].label == "Account Number");
    }

    SECTION("Lines without vocabulary are not paired")
    {
        std::vector<std::string> lines = { "Hello World", "Goodbye World" };
        REQUIRE(matcher.match(lines, stats).empty());
        REQUIRE(stats.pattern_attempts == 4);
    }

    SECTION("Empty input")
    {
        REQUIRE(matcher.match({}, stats).empty());
        REQUIRE(stats.lines_processed == 0);
        REQUIRE(stats.pattern_attempts == 0);
    }
}

TEST_CASE("PatternMatcher - inline gate decides whether a line can pair", "[matcher]")
{
    const std::vector<std::string> lines = { "Account Number: 1234", "Example text" };
    DetectionStats stats;

    SECTION("Accepted inline candidate claims the line")
    {
        PatternMatcher matcher(PatternSet::defaults(), LabelVocabulary::defaults(),
                               [](const Candidate&) { return true; });
        auto candidates = matcher.match(lines, stats);
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].form == PatternForm::InlineColon);
    }

    SECTION("Rejected inline candidate leaves the line free to pair")
    {
        PatternMatcher matcher(PatternSet::defaults(), LabelVocabulary::defaults(),
                               [](const Candidate&) { return false; });
        auto candidates = matcher.match(lines, stats);
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0].form == PatternForm::InlineColon);
        REQUIRE(candidates[1].form == PatternForm::LineBreak);
        REQUIRE(candidates[1].label == "Account Number: 1234");
        REQUIRE(candidates[1].value == "Example text");
        REQUIRE(candidates[1].line_number == 1);
    }
}

TEST_CASE("PatternMatcher - failing pattern is skipped and matching continues", "[matcher]")
{
    FailingColonMatcher matcher;
    DetectionStats stats;

    std::vector<std::string> lines = { "Acct # 5678", "Account No", "9999" };
    auto candidates = matcher.match(lines, stats);

    REQUIRE(candidates.size() == 2);
    REQUIRE(candidates[0].form == PatternForm::InlineKeyword);
    REQUIRE(candidates[0].value == "5678");
    REQUIRE(candidates[1].form == PatternForm::LineBreak);
    REQUIRE(candidates[1].label == "Account No");
    REQUIRE(candidates[1].value == "9999");

    REQUIRE(stats.pattern_failures == 3);
    REQUIRE(stats.pattern_attempts == 7);
    REQUIRE(stats.candidates == 2);
}

TEST_CASE("PatternMatcher - value lines", "[matcher]")
{
    auto matcher = defaultMatcher();
    REQUIRE(matcher.isValueLine("John Smith"));
    REQUIRE(matcher.isValueLine("1234"));
    REQUIRE_FALSE(matcher.isValueLine(""));
    REQUIRE_FALSE(matcher.isValueLine("Name:"));
    REQUIRE_FALSE(matcher.isValueLine("Account Number"));
    REQUIRE_FALSE(matcher.isValueLine("routing # 021000021"));
}

TEST_CASE("MatchOutcome - factories", "[matcher]")
{
    auto failed = MatchOutcome::failed("regex_error");
    REQUIRE(failed.status == MatchStatus::Failed);
    REQUIRE(failed.error == "regex_error");
    REQUIRE(failed.label.empty());

    REQUIRE(MatchOutcome::noMatch().status == MatchStatus::NoMatch);
    REQUIRE(toString(PatternForm::BlankLineSeparated) == std::string("blank_line_separated"));
}
