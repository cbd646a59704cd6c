#include "FormFieldDetector.hpp"
#include "Diagnostics.hpp"
#include "FieldDeduplicator.hpp"
#include "NFKCTextNormalizer.hpp"
#include "PatternMatcher.hpp"
#include "StageRunner.hpp"
#include "TextNormalizer.hpp"

#include <plog/Log.h>

namespace detection
{

struct FormFieldDetector::Impl
{
    DetectionConfig config;
    std::unique_ptr<ITextNormalizer> normalizer;
    PatternSet patterns;
    InputSanitizer sanitizer;
    PatternMatcher matcher;
    ConfidenceScorer scorer;
    FieldDeduplicator deduplicator;
    AccountInfoExtractor extractor;

    Impl(DetectionConfig cfg, const LabelVocabulary& vocab)
        : config(cfg)
        , normalizer(makeNormalizer(cfg))
        , patterns(vocab)
        , sanitizer(config, *normalizer)
        , matcher(patterns, vocab, [this](const Candidate& candidate) { return keeps(candidate); })
        , scorer(vocab)
        , deduplicator(vocab)
        , extractor(vocab)
    {
    }

    static std::unique_ptr<ITextNormalizer> makeNormalizer(const DetectionConfig& cfg)
    {
        if (cfg.normalize_unicode)
            return std::make_unique<NFKCTextNormalizer>();
        return std::make_unique<LineEndingNormalizer>();
    }

    // An inline candidate only claims its line if it will survive scoring.
    bool keeps(const Candidate& candidate) const
    {
        return ConfidenceScorer::passes(scorer.score(candidate.label, candidate.value), config.confidence_threshold);
    }

    std::vector<DetectedField> score(const std::vector<Candidate>& candidates, DetectionStats& stats) const
    {
        std::vector<DetectedField> retained;
        for (const auto& candidate : candidates)
        {
            double confidence = scorer.score(candidate.label, candidate.value);
            if (!ConfidenceScorer::passes(confidence, config.confidence_threshold))
            {
                if (Diagnostics::IsVerbose())
                {
                    PLOG_DEBUG_(Diagnostics::kLogInstance)
                        << "[FormFieldDetector] drop line=" << candidate.line_number << " label="
                        << Diagnostics::Preview(candidate.label) << " confidence=" << confidence;
                }
                continue;
            }
            retained.emplace_back(candidate.label, candidate.value, confidence, candidate.line_number);
        }
        stats.retained = retained.size();
        return retained;
    }
};

FormFieldDetector::FormFieldDetector(DetectionConfig config, const LabelVocabulary& vocabulary)
    : impl_(std::make_unique<Impl>(config, vocabulary))
{
}

FormFieldDetector::~FormFieldDetector() = default;

std::vector<DetectedField> FormFieldDetector::detect(std::string_view raw_text) const
{
    return detectWithStats(raw_text).fields;
}

DetectionResult FormFieldDetector::detectWithStats(std::string_view raw_text) const
{
    DetectionResult out;
    if (raw_text.data() == nullptr || raw_text.empty())
        return out;

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[FormFieldDetector] input bytes=" << raw_text.size() << " preview=" << Diagnostics::Preview(raw_text);
    }

    auto track = [&out](const auto& stage) {
        out.stages.push_back(StageTiming{ stage.stage_name, stage.duration, stage.ok() });
        return stage.ok();
    };

    auto sanitized = run_stage<SanitizedText>(
        "sanitize", [&]() { return impl_->sanitizer.sanitize(raw_text); }, utils::ErrorCategory::Sanitization);
    if (!track(sanitized))
        return out;
    out.sanitize_report = sanitized.value->report;
    const auto& lines = sanitized.value->lines;

    DetectionStats stats;
    auto matched = run_stage<std::vector<Candidate>>(
        "match", [&]() { return impl_->matcher.match(lines, stats); }, utils::ErrorCategory::PatternMatching);
    if (!track(matched))
        return out;
    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[FormFieldDetector] stage=match lines=" << lines.size()
                                              << " candidates=" << matched.value->size()
                                              << " attempts=" << stats.pattern_attempts
                                              << " failures=" << stats.pattern_failures;
    }

    auto scored = run_stage<std::vector<DetectedField>>("score",
                                                        [&]() { return impl_->score(*matched.value, stats); });
    if (!track(scored))
        return out;

    auto unique = run_stage<std::vector<DetectedField>>(
        "deduplicate", [&]() { return impl_->deduplicator.deduplicate(*scored.value); });
    if (!track(unique))
        return out;

    stats.fields = unique.value->size();
    out.fields = std::move(*unique.value);
    out.stats = stats;

    PLOG_INFO << "Form field detection: lines=" << stats.lines_processed << " candidates=" << stats.candidates
              << " retained=" << stats.retained << " fields=" << stats.fields;
    return out;
}

AccountInfo FormFieldDetector::extractAccountInfo(const std::vector<DetectedField>& fields) const
{
    auto extracted = run_stage<AccountInfo>("extract_account_info",
                                            [&]() { return impl_->extractor.extract(fields); });
    return extracted.ok() ? std::move(*extracted.value) : AccountInfo{};
}

ConfidenceBreakdown FormFieldDetector::explain(const DetectedField& field) const
{
    return impl_->scorer.breakdown(field.label, field.value);
}

const DetectionConfig& FormFieldDetector::config() const noexcept
{
    return impl_->config;
}

namespace
{

const FormFieldDetector& defaultDetector()
{
    static const FormFieldDetector detector;
    return detector;
}

} // namespace

std::vector<DetectedField> detect_form_fields(std::string_view raw_text)
{
    return defaultDetector().detect(raw_text);
}

AccountInfo extract_account_info(const std::vector<DetectedField>& fields)
{
    return defaultDetector().extractAccountInfo(fields);
}

} // namespace detection
