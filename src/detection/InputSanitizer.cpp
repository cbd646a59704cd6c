#include "InputSanitizer.hpp"
#include "TextUtils.hpp"
#include "Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace detection
{

InputSanitizer::InputSanitizer(const DetectionConfig& config, const ITextNormalizer& normalizer)
    : config_(config)
    , normalizer_(normalizer)
{
}

SanitizedText InputSanitizer::sanitize(std::string_view raw_text) const
{
    PROFILE_SCOPE_FUNCTION();
    SanitizedText out;
    out.report.input_bytes = raw_text.size();

    // Absent (null view) and blank input both yield no lines.
    if (raw_text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos)
        return out;

    std::string text = capText(raw_text, out.report);
    text = normalizer_.normalize(text);
    // Normalization may expand the text; the cap holds on what the matcher sees.
    text = capText(text, out.report);

    std::vector<std::string> lines = splitLines(text);
    out.report.lines_total = lines.size();

    if (lines.size() > config_.max_lines)
    {
        out.report.lines_dropped = lines.size() - config_.max_lines;
        PLOG_WARNING << "Too many lines: " << lines.size() << ", limiting to first " << config_.max_lines << " lines";
        lines.resize(config_.max_lines);
    }

    out.lines.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string line = trim(lines[i]);
        std::string_view capped = truncate_codepoints(line, config_.max_line_length);
        if (capped.size() < line.size())
        {
            ++out.report.lines_shortened;
            PLOG_DEBUG << "Line " << (i + 1) << " too long (" << codepoint_length(line) << " chars), truncating to "
                       << config_.max_line_length << " chars";
            line = trim(capped);
        }
        out.lines.push_back(std::move(line));
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[InputSanitizer] bytes=" << out.report.input_bytes << " lines=" << out.lines.size()
            << " dropped=" << out.report.lines_dropped << " shortened=" << out.report.lines_shortened
            << " truncated=" << (out.report.text_truncated ? "yes" : "no");
    }

    return out;
}

std::string InputSanitizer::capText(std::string_view text, SanitizeReport& report) const
{
    if (text.size() <= config_.max_text_bytes)
        return std::string(text);

    PLOG_WARNING << "OCR text too large: " << text.size() << " bytes, truncating to " << config_.max_text_bytes
                 << " bytes";
    report.text_truncated = true;
    return std::string(truncate_utf8_bytes(text, config_.max_text_bytes));
}

std::vector<std::string> InputSanitizer::splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos)
        {
            lines.emplace_back(text, start, std::string::npos);
            break;
        }
        lines.emplace_back(text, start, end - start);
        start = end + 1;
    }

    // Trailing empty segments from a final newline are not lines.
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();

    return lines;
}

} // namespace detection
