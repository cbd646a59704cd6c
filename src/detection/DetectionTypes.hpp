#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace detection {

// Core data contracts shared by the detection stages.

// One label/value pair, either a scored candidate or a final field.
// Construction enforces the invariants: label and value are non-empty after
// trimming and confidence lies in [0, 1]. Violations throw std::invalid_argument.
struct DetectedField {
    std::string label;        // Field name as it appeared in the text, trimmed, case preserved
    std::string value;        // Associated data, trimmed
    double confidence = 0.0;  // Heuristic score in [0, 1]
    std::size_t line_number = 0; // 1-based line in the (possibly truncated) input

    DetectedField(std::string label_in, std::string value_in, double confidence_in, std::size_t line);
};

// Work counters for one detection run. attempts is bounded by
// lines_processed * patterns, regardless of line content.
struct DetectionStats {
    std::size_t lines_processed = 0;   // non-empty lines fed to the matcher
    std::size_t pattern_attempts = 0;  // regex applications, inline and multi-line
    std::size_t pattern_failures = 0;  // applications that threw and were treated as no match
    std::size_t candidates = 0;        // non-empty label/value pairs proposed
    std::size_t retained = 0;          // candidates scoring above the threshold
    std::size_t fields = 0;            // fields left after deduplication
};

// Outcome of one pipeline stage. value is set on success, error on failure.
template<typename T>
struct StageResult {
    std::string stage_name;
    std::chrono::microseconds duration{ 0 };
    std::optional<T> value;
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return value.has_value(); }
};

struct StageTiming {
    std::string stage_name;
    std::chrono::microseconds duration{ 0 };
    bool ok = true;
};

} // namespace detection
