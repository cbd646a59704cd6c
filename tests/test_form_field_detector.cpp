#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "detection/FormFieldDetector.hpp"
#include "detection/PatternMatcher.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;
using namespace detection;

namespace
{

const DetectedField* findByLabel(const std::vector<DetectedField>& fields, const std::string& label)
{
    auto it = std::find_if(fields.begin(), fields.end(), [&](const DetectedField& f) { return f.label == label; });
    return it == fields.end() ? nullptr : &*it;
}

bool sameFields(const std::vector<DetectedField>& a, const std::vector<DetectedField>& b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (a[i].label != b[i].label || a[i].value != b[i].value || a[i].confidence != b[i].confidence ||
            a[i].line_number != b[i].line_number)
            return false;
    }
    return true;
}

std::string statementDocument()
{
    return "FIRST EXAMPLE BANK\n"
           "Statement Period: Jan 1 - Jan 31, 2024\n"
           "Account Number: **** **** **** 4821\n"
           "Account Type: Checking\n"
           "\n"
           "ACCOUNT HOLDER\n"
           "\n"
           "John Smith\n"
           "Routing Number 021000021\n"
           "Closing Balance: $1,234.56\n";
}

} // namespace

TEST_CASE("FormFieldDetector - simple colon fields", "[detector]")
{
    auto fields = detect_form_fields("Account Number: 1234\nInstitution: Example Bank\n");
    REQUIRE(fields.size() == 2);

    const auto* account = findByLabel(fields, "Account Number");
    REQUIRE(account != nullptr);
    REQUIRE(account->value == "1234");
    REQUIRE(account->line_number == 1);
    REQUIRE_THAT(account->confidence, WithinAbs(0.9, 1e-9));

    const auto* institution = findByLabel(fields, "Institution");
    REQUIRE(institution != nullptr);
    REQUIRE(institution->value == "Example Bank");
    REQUIRE(institution->line_number == 2);
    REQUIRE(institution->confidence >= 0.7);

    auto info = extract_account_info(fields);
    REQUIRE(info.size() == 2);
    REQUIRE(info.at(AccountInfoExtractor::kAccountNumber) == "1234");
    REQUIRE(info.at(AccountInfoExtractor::kInstitutionName) == "Example Bank");
}

TEST_CASE("FormFieldDetector - noisy multiline field", "[detector]")
{
    auto fields = detect_form_fields("ACCOUNT HOLDER\n\nJohn Smith\n");
    REQUIRE(fields.size() == 1);
    REQUIRE(fields[0].label == "ACCOUNT HOLDER");
    REQUIRE(fields[0].value == "John Smith");
    REQUIRE(fields[0].line_number == 1);
    REQUIRE(fields[0].confidence > 0.5);

    auto info = extract_account_info(fields);
    REQUIRE(info.at(AccountInfoExtractor::kAccountName) == "John Smith");
}

TEST_CASE("FormFieldDetector - account number synonyms share one key", "[detector]")
{
    const auto& vocabulary = LabelVocabulary::defaults();

    SECTION("Each variant is detected on its own")
    {
        for (const char* text : { "Account Number: 1234", "Acct # 1234", "Account No\n1234" })
        {
            INFO(text);
            auto fields = detect_form_fields(text);
            REQUIRE(fields.size() == 1);
            REQUIRE(vocabulary.canonicalKey(fields[0].label) == "account number");
            REQUIRE(fields[0].value == "1234");
        }
    }

    SECTION("All variants in one call collapse to the first best field")
    {
        auto fields = detect_form_fields("Account Number: 1234\nAcct # 1234\nAccount No\n1234\n");
        REQUIRE(fields.size() == 1);
        REQUIRE(vocabulary.canonicalKey(fields[0].label) == "account number");
        REQUIRE(fields[0].label == "Account Number");
        REQUIRE(fields[0].line_number == 1);
    }
}

TEST_CASE("FormFieldDetector - oversized input keeps the first 10000 lines", "[detector]")
{
    std::string text;
    text.reserve(20000 * 16);
    for (int line = 1; line <= 20000; ++line)
    {
        if (line == 5000)
            text += "Institution: Example Bank\n";
        else if (line == 15000)
            text += "Routing Number: 021000021\n";
        else
            text += "lorem ipsum\n";
    }

    FormFieldDetector detector;
    auto result = detector.detectWithStats(text);

    REQUIRE(result.sanitize_report.lines_total == 20000);
    REQUIRE(result.sanitize_report.lines_dropped == 10000);
    REQUIRE(result.stats.lines_processed == 10000);

    REQUIRE(result.fields.size() == 1);
    REQUIRE(result.fields[0].label == "Institution");
    REQUIRE(result.fields[0].line_number == 5000);
    for (const auto& field : result.fields)
        REQUIRE(field.line_number <= 10000);
}

TEST_CASE("FormFieldDetector - empty and garbage input", "[detector]")
{
    REQUIRE(detect_form_fields("").empty());
    REQUIRE(detect_form_fields(std::string_view{}).empty());
    REQUIRE(detect_form_fields("   \n\t  \r\n ").empty());
    REQUIRE(detect_form_fields("!@#$%^&*()_+{}|:\"<>?").empty());
    REQUIRE(detect_form_fields("~~ ## %% :: ;; 12 34 -- ** //").empty());
    REQUIRE(extract_account_info({}).empty());
}

TEST_CASE("FormFieldDetector - confidence stays in (0.5, 1.0]", "[detector]")
{
    auto fields = detect_form_fields(statementDocument());
    REQUIRE_FALSE(fields.empty());
    for (const auto& field : fields)
    {
        INFO(field.label);
        REQUIRE(field.confidence > 0.5);
        REQUIRE(field.confidence <= 1.0);
    }
}

TEST_CASE("FormFieldDetector - repeated runs are identical", "[detector]")
{
    const std::string text = statementDocument();
    auto first = detect_form_fields(text);
    auto second = detect_form_fields(text);
    REQUIRE(sameFields(first, second));
}

TEST_CASE("FormFieldDetector - statement document", "[detector]")
{
    FormFieldDetector detector;
    auto fields = detector.detect(statementDocument());

    const auto* holder = findByLabel(fields, "ACCOUNT HOLDER");
    REQUIRE(holder != nullptr);
    REQUIRE(holder->value == "John Smith");
    REQUIRE(holder->line_number == 6);

    const auto* routing = findByLabel(fields, "Routing Number");
    REQUIRE(routing != nullptr);
    REQUIRE(routing->value == "021000021");

    const auto* balance = findByLabel(fields, "Closing Balance");
    REQUIRE(balance != nullptr);
    REQUIRE(balance->value == "$1,234.56");

    auto info = detector.extractAccountInfo(fields);
    REQUIRE(info.at(AccountInfoExtractor::kAccountNumber) == "4821");
    REQUIRE(info.at(AccountInfoExtractor::kAccountType) == "Checking");
    REQUIRE(info.at(AccountInfoExtractor::kAccountName) == "John Smith");
}

TEST_CASE("FormFieldDetector - pattern work is bounded per line", "[detector]")
{
    std::string text;
    for (int i = 0; i < 500; ++i)
        text += "Account Number: 1234\nAccount No\n5678\n\nrandom words here\n";

    FormFieldDetector detector;
    auto result = detector.detectWithStats(text);

    const std::size_t patterns = PatternSet::defaults().definitions().size();
    REQUIRE(result.stats.lines_processed == 2000);
    REQUIRE(result.stats.pattern_attempts <= result.stats.lines_processed * patterns);
    REQUIRE(result.stats.pattern_failures == 0);
}

TEST_CASE("FormFieldDetector - edge cases", "[detector]")
{
    SECTION("Inline value is not reused as a label for the next line")
    {
        auto fields = detect_form_fields("Account Number: 1234\nInstitution: Example Bank");
        REQUIRE(findByLabel(fields, "Account Number: 1234") == nullptr);
        REQUIRE(fields.size() == 2);
    }

    SECTION("Weak inline match does not block the multi-line field")
    {
        auto fields = detect_form_fields("Ref: x Account Holder\nJohn Smith");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].label == "Ref: x Account Holder");
        REQUIRE(fields[0].value == "John Smith");
        REQUIRE(fields[0].line_number == 1);
        REQUIRE_THAT(fields[0].confidence, WithinAbs(1.0, 1e-9));
        REQUIRE(extract_account_info(fields).at(AccountInfoExtractor::kAccountName) == "John Smith");
    }

    SECTION("A label line followed by another label is not paired")
    {
        auto fields = detect_form_fields("Account Holder\nAccount Number: 1234");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].label == "Account Number");
    }

    SECTION("Several blank lines between label and value")
    {
        auto fields = detect_form_fields("Account No\n\n\n\n1234");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].value == "1234");
        REQUIRE(fields[0].line_number == 1);
    }

    SECTION("Leading blank lines keep line numbers")
    {
        auto fields = detect_form_fields("\n\nInstitution: Example Bank");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].line_number == 3);
    }

    SECTION("Windows line endings")
    {
        auto fields = detect_form_fields("Account Number: 1234\r\nInstitution: Example Bank\r\n");
        REQUIRE(fields.size() == 2);
        REQUIRE(findByLabel(fields, "Institution")->value == "Example Bank");
    }

    SECTION("Duplicate labels keep the first on a tie")
    {
        auto fields = detect_form_fields("Account Number: 1111\nAccount Number: 2222");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].value == "1111");
    }

    SECTION("Special characters in values")
    {
        auto fields = detect_form_fields("Account Number: ****-****-1234");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].value == "****-****-1234");
    }

    SECTION("Unicode values")
    {
        auto fields = detect_form_fields("Account Holder: José Müller");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].value == "José Müller");
    }

    SECTION("Full-width OCR output is normalized")
    {
        auto fields = detect_form_fields("Ａｃｃｏｕｎｔ Ｎｕｍｂｅｒ：１２３４");
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].label == "Account Number");
        REQUIRE(fields[0].value == "1234");
    }

    SECTION("Very long line does not break detection")
    {
        std::string text = "Account Number: " + std::string(5000, '7');
        auto fields = detect_form_fields(text);
        for (const auto& field : fields)
        {
            REQUIRE(field.confidence > 0.5);
            REQUIRE(field.value.size() <= 1000);
        }
    }
}

TEST_CASE("FormFieldDetector - configuration", "[detector]")
{
    SECTION("Higher threshold drops weak fields")
    {
        const std::string text = "Statement Date: x\nInstitution: Example Bank";
        REQUIRE(detect_form_fields(text).size() == 2);

        DetectionConfig cfg;
        cfg.confidence_threshold = 0.85;
        FormFieldDetector strict(cfg);
        auto fields = strict.detect(text);
        REQUIRE(fields.size() == 1);
        REQUIRE(fields[0].label == "Institution");
    }

    SECTION("Unicode normalization can be switched off")
    {
        DetectionConfig cfg;
        cfg.normalize_unicode = false;
        FormFieldDetector detector(cfg);
        REQUIRE(detector.detect("Ａｃｃｏｕｎｔ Ｎｕｍｂｅｒ：１２３４").empty());
        REQUIRE(detector.detect("Account Number: 1234").size() == 1);
    }

    SECTION("Line cap is configurable")
    {
        DetectionConfig cfg;
        cfg.max_lines = 1;
        FormFieldDetector detector(cfg);
        auto result = detector.detectWithStats("Account Number: 1234\nInstitution: Example Bank");
        REQUIRE(result.fields.size() == 1);
        REQUIRE(result.sanitize_report.lines_dropped == 1);
    }
}

TEST_CASE("FormFieldDetector - stages are timed in run order", "[detector]")
{
    FormFieldDetector detector;
    auto result = detector.detectWithStats("Account Number: 1234");

    REQUIRE(result.stages.size() == 4);
    REQUIRE(result.stages[0].stage_name == "sanitize");
    REQUIRE(result.stages[1].stage_name == "match");
    REQUIRE(result.stages[2].stage_name == "score");
    REQUIRE(result.stages[3].stage_name == "deduplicate");
    for (const auto& stage : result.stages)
        REQUIRE(stage.ok);

    REQUIRE(detector.detectWithStats("").stages.empty());
}

TEST_CASE("FormFieldDetector - explain reports the score signals", "[detector]")
{
    FormFieldDetector detector;
    auto fields = detector.detect("Account Number: 1234");
    REQUIRE(fields.size() == 1);

    auto breakdown = detector.explain(fields[0]);
    REQUIRE_THAT(breakdown.vocabulary, WithinAbs(0.4, 1e-9));
    REQUIRE_THAT(breakdown.value, WithinAbs(0.3, 1e-9));
    REQUIRE_THAT(breakdown.label_shape, WithinAbs(0.2, 1e-9));
    REQUIRE_THAT(breakdown.total, WithinAbs(fields[0].confidence, 1e-9));
    REQUIRE(breakdown.matched_phrase == "account number");
}

TEST_CASE("FormFieldDetector - concurrent detection", "[detector]")
{
    const std::string text = statementDocument();
    const auto expected = detect_form_fields(text);

    constexpr int kThreads = 8;
    std::vector<std::vector<DetectedField>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 20; ++i)
                results[t] = detect_form_fields(text);
        });
    }
    for (auto& thread : threads)
        thread.join();

    for (const auto& result : results)
        REQUIRE(sameFields(result, expected));
}

TEST_CASE("DetectedField - construction enforces invariants", "[detector]")
{
    DetectedField field("  Account Number ", " 1234\t", 0.9, 3);
    REQUIRE(field.label == "Account Number");
    REQUIRE(field.value == "1234");
    REQUIRE(field.line_number == 3);

    REQUIRE_THROWS_AS(DetectedField("", "1234", 0.9, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(DetectedField("Label", "   ", 0.9, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(DetectedField("Label", "1234", 1.5, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(DetectedField("Label", "1234", -0.1, 1), std::invalid_argument);
}
