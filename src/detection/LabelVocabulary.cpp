#include "LabelVocabulary.hpp"
#include "TextUtils.hpp"

namespace detection
{

namespace
{

std::vector<std::string> lowered(std::vector<std::string> items)
{
    for (auto& item : items)
        item = to_lower_utf8(item);
    return items;
}

std::vector<std::string> defaultPhrases()
{
    return {
        // Account information
        "account number", "account #", "account no", "acct number", "acct #",
        "card number", "card #", "card no", "credit card number",
        "account name", "account holder", "account holder name",
        "institution", "institution name", "bank", "bank name",
        "account type", "type", "product name", "product type",
        "routing number", "routing #", "aba number",
        "iban", "swift code", "bic",

        // Statement information
        "statement date", "statement period", "period",
        "opening balance", "closing balance", "ending balance",
        "available balance", "current balance",
        "statement number", "statement #",

        // Contact information
        "address", "mailing address", "billing address",
        "phone", "phone number", "telephone",
        "email", "e-mail", "email address",
    };
}

std::vector<std::string> defaultKeywords()
{
    return { "account", "acct", "card", "institution", "bank", "statement", "balance",
             "routing", "iban", "swift", "phone", "email", "address" };
}

std::vector<SynonymCluster> defaultClusters()
{
    return {
        { "account number", { "account number", "account #", "account no", "acct number", "acct #" } },
        { "card number", { "card number", "card #", "card no", "credit card number" } },
        { "routing number", { "routing number", "routing #", "aba number" } },
    };
}

} // namespace

LabelVocabulary::LabelVocabulary(std::vector<std::string> phrases, std::vector<std::string> structural_keywords,
                                 std::vector<SynonymCluster> clusters)
    : phrases_(lowered(std::move(phrases)))
    , structural_keywords_(lowered(std::move(structural_keywords)))
    , clusters_(std::move(clusters))
{
    for (auto& cluster : clusters_)
    {
        cluster.canonical = to_lower_utf8(cluster.canonical);
        cluster.variants = lowered(std::move(cluster.variants));
    }
}

const LabelVocabulary& LabelVocabulary::defaults()
{
    static const LabelVocabulary vocabulary(defaultPhrases(), defaultKeywords(), defaultClusters());
    return vocabulary;
}

std::optional<std::string_view> LabelVocabulary::findPhrase(std::string_view lower_text) const
{
    for (const auto& phrase : phrases_)
    {
        if (contains(lower_text, phrase))
            return std::string_view(phrase);
    }
    return std::nullopt;
}

bool LabelVocabulary::startsWithPhrase(std::string_view lower_text) const
{
    for (const auto& phrase : phrases_)
    {
        if (starts_with(lower_text, phrase))
            return true;
    }
    return false;
}

std::string LabelVocabulary::canonicalKey(std::string_view label) const
{
    std::string normalized = to_lower_utf8(trim(label));
    for (const auto& cluster : clusters_)
    {
        for (const auto& variant : cluster.variants)
        {
            if (contains(normalized, variant))
                return cluster.canonical;
        }
    }
    return normalized;
}

} // namespace detection
