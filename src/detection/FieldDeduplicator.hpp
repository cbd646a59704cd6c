#pragma once

#include "DetectionTypes.hpp"
#include "LabelVocabulary.hpp"

#include <vector>

namespace detection
{

// Collapses candidates onto one field per canonical key. Synonymous labels
// ("Acct #", "Account No") share the key of their cluster; among fields of one
// key the highest confidence survives and exact ties keep the earliest.
class FieldDeduplicator
{
public:
    explicit FieldDeduplicator(const LabelVocabulary& vocabulary);

    // Output follows the first-seen order of the keys.
    [[nodiscard]] std::vector<DetectedField> deduplicate(const std::vector<DetectedField>& fields) const;

private:
    const LabelVocabulary& vocabulary_;
};

} // namespace detection
