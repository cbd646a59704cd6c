#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace detection
{

// A group of label spellings that name the same logical field.
struct SynonymCluster
{
    std::string canonical;             // e.g. "account number"
    std::vector<std::string> variants; // lowercase substrings, e.g. "acct #"
};

// Immutable table of known form-field labels. Built once and shared read-only,
// so concurrent detection runs need no synchronization.
class LabelVocabulary
{
public:
    // Phrases, keywords and variants are lowercased on construction; phrase order is kept.
    LabelVocabulary(std::vector<std::string> phrases, std::vector<std::string> structural_keywords,
                    std::vector<SynonymCluster> clusters);

    // Financial statement vocabulary used by the default detector.
    static const LabelVocabulary& defaults();

    // First phrase (in table order) contained in `lower_text`.
    [[nodiscard]] std::optional<std::string_view> findPhrase(std::string_view lower_text) const;

    [[nodiscard]] bool startsWithPhrase(std::string_view lower_text) const;

    // Trimmed lowercase label, mapped onto its cluster's canonical key when a variant is contained.
    [[nodiscard]] std::string canonicalKey(std::string_view label) const;

    [[nodiscard]] const std::vector<std::string>& phrases() const noexcept { return phrases_; }
    [[nodiscard]] const std::vector<std::string>& structuralKeywords() const noexcept { return structural_keywords_; }
    [[nodiscard]] const std::vector<SynonymCluster>& clusters() const noexcept { return clusters_; }

private:
    std::vector<std::string> phrases_;
    std::vector<std::string> structural_keywords_;
    std::vector<SynonymCluster> clusters_;
};

} // namespace detection
