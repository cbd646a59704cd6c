#include "FieldDeduplicator.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

#include <unordered_map>

namespace detection
{

FieldDeduplicator::FieldDeduplicator(const LabelVocabulary& vocabulary)
    : vocabulary_(vocabulary)
{
}

std::vector<DetectedField> FieldDeduplicator::deduplicate(const std::vector<DetectedField>& fields) const
{
    std::vector<DetectedField> unique;
    std::unordered_map<std::string, std::size_t> slot_by_key;
    unique.reserve(fields.size());

    for (const auto& field : fields)
    {
        std::string key = vocabulary_.canonicalKey(field.label);
        if (key.empty())
            continue;

        auto it = slot_by_key.find(key);
        if (it == slot_by_key.end())
        {
            slot_by_key.emplace(std::move(key), unique.size());
            unique.push_back(field);
            continue;
        }

        DetectedField& kept = unique[it->second];
        if (field.confidence > kept.confidence)
        {
            if (Diagnostics::IsVerbose())
            {
                PLOG_DEBUG_(Diagnostics::kLogInstance)
                    << "[FieldDeduplicator] key='" << it->first << "' line " << field.line_number
                    << " replaces line " << kept.line_number << " (" << field.confidence << " > "
                    << kept.confidence << ")";
            }
            kept = field;
        }
    }

    return unique;
}

} // namespace detection
