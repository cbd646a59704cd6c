#pragma once

#include "AccountInfoExtractor.hpp"
#include "ConfidenceScorer.hpp"
#include "DetectionConfig.hpp"
#include "DetectionTypes.hpp"
#include "InputSanitizer.hpp"
#include "LabelVocabulary.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace detection
{

struct DetectionResult
{
    std::vector<DetectedField> fields;
    DetectionStats stats;
    SanitizeReport sanitize_report;
    std::vector<StageTiming> stages; // in run order; stops at the first failed stage
};

// Runs OCR text through sanitize -> match -> score -> deduplicate.
// Never throws on data: a failing stage is logged, reported and yields no fields.
// The vocabulary must outlive the detector.
class FormFieldDetector
{
public:
    explicit FormFieldDetector(DetectionConfig config = {},
                               const LabelVocabulary& vocabulary = LabelVocabulary::defaults());
    ~FormFieldDetector();

    FormFieldDetector(const FormFieldDetector&) = delete;
    FormFieldDetector& operator=(const FormFieldDetector&) = delete;

    [[nodiscard]] std::vector<DetectedField> detect(std::string_view raw_text) const;
    [[nodiscard]] DetectionResult detectWithStats(std::string_view raw_text) const;
    [[nodiscard]] AccountInfo extractAccountInfo(const std::vector<DetectedField>& fields) const;

    // Per-signal score of a label/value pair under this detector's vocabulary.
    [[nodiscard]] ConfidenceBreakdown explain(const DetectedField& field) const;

    [[nodiscard]] const DetectionConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Process-wide detector with default configuration.
[[nodiscard]] std::vector<DetectedField> detect_form_fields(std::string_view raw_text);
[[nodiscard]] AccountInfo extract_account_info(const std::vector<DetectedField>& fields);

} // namespace detection
