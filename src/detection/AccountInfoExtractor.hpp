#pragma once

#include "DetectionTypes.hpp"
#include "LabelVocabulary.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace detection
{

using AccountInfo = std::unordered_map<std::string, std::string>;

// Derives account attributes from detected fields. When several fields feed
// the same key, the higher confidence wins, then the lower line number, then
// the field processed last.
class AccountInfoExtractor
{
public:
    static constexpr const char* kAccountNumber = "accountNumber";
    static constexpr const char* kInstitutionName = "institutionName";
    static constexpr const char* kAccountName = "accountName";
    static constexpr const char* kAccountType = "accountType";

    explicit AccountInfoExtractor(const LabelVocabulary& vocabulary);

    [[nodiscard]] AccountInfo extract(const std::vector<DetectedField>& fields) const;

    // Four-digit account suffix from a masked or separated number, if any.
    [[nodiscard]] static std::optional<std::string> extractAccountNumber(std::string_view value);

private:
    const LabelVocabulary& vocabulary_;
};

} // namespace detection
