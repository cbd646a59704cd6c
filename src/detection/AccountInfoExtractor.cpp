#include "AccountInfoExtractor.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

namespace detection
{

namespace
{

bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

// Any ASCII whitespace or a hyphen separates digit groups.
bool isSeparator(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v' || c == '-';
}

struct Slot
{
    std::string value;
    double confidence = 0.0;
    std::size_t line_number = 0;
};

using SlotMap = std::unordered_map<std::string, Slot>;

void offer(SlotMap& slots, const char* key, std::string value, const DetectedField& field)
{
    auto it = slots.find(key);
    if (it != slots.end())
    {
        const Slot& current = it->second;
        if (field.confidence < current.confidence)
            return;
        if (field.confidence == current.confidence && field.line_number > current.line_number)
            return;
    }

    slots[key] = Slot{ std::move(value), field.confidence, field.line_number };
}

} // namespace

AccountInfoExtractor::AccountInfoExtractor(const LabelVocabulary& vocabulary)
    : vocabulary_(vocabulary)
{
}

AccountInfo AccountInfoExtractor::extract(const std::vector<DetectedField>& fields) const
{
    SlotMap slots;

    for (const auto& field : fields)
    {
        if (trim(field.label).empty() || trim(field.value).empty())
            continue;

        std::string label = to_lower_utf8(trim(field.label));
        std::string key = vocabulary_.canonicalKey(label);

        if (key == "account number" || key == "card number")
        {
            if (auto number = extractAccountNumber(field.value))
                offer(slots, kAccountNumber, std::move(*number), field);
            else if (Diagnostics::IsVerbose())
                PLOG_DEBUG_(Diagnostics::kLogInstance) << "[AccountInfoExtractor] no digit run in '"
                                                       << Diagnostics::Preview(field.value) << "'";
        }

        if (contains(label, "institution") || contains(label, "bank"))
            offer(slots, kInstitutionName, field.value, field);

        if (contains(label, "account name") || contains(label, "account holder"))
            offer(slots, kAccountName, field.value, field);

        if (contains(label, "account type") || contains(label, "product type") || contains(label, "type"))
            offer(slots, kAccountType, field.value, field);
    }

    AccountInfo info;
    for (auto& [key, slot] : slots)
        info.emplace(key, std::move(slot.value));
    return info;
}

std::optional<std::string> AccountInfoExtractor::extractAccountNumber(std::string_view value)
{
    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value)
    {
        if (isDigit(c) || isSeparator(c))
            cleaned.push_back(c);
    }

    // A four-digit window followed by a separator or the end of the value.
    for (std::size_t i = 0; i + 4 <= cleaned.size(); ++i)
    {
        bool digits = isDigit(cleaned[i]) && isDigit(cleaned[i + 1]) && isDigit(cleaned[i + 2]) && isDigit(cleaned[i + 3]);
        if (!digits)
            continue;
        if (i + 4 == cleaned.size() || isSeparator(cleaned[i + 4]))
            return cleaned.substr(i, 4);
    }

    // Fallback: a standalone run of exactly four digits.
    for (std::size_t i = 0; i < cleaned.size();)
    {
        if (!isDigit(cleaned[i]))
        {
            ++i;
            continue;
        }
        std::size_t end = i;
        while (end < cleaned.size() && isDigit(cleaned[end]))
            ++end;
        if (end - i == 4)
            return cleaned.substr(i, 4);
        i = end;
    }

    return std::nullopt;
}

} // namespace detection
