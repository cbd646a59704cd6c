#include "Diagnostics.hpp"
#include "TextUtils.hpp"

namespace detection
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::string_view head = truncate_utf8_bytes(text, MaxPreview());

    std::string out;
    out.reserve(head.size() + 24);
    for (char ch : head)
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(isControl(ch) ? '?' : ch);
            break;
        }
    }

    if (head.size() < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

bool Diagnostics::isControl(char ch) noexcept
{
    auto c = static_cast<unsigned char>(ch);
    return c < 0x20 || c == 0x7F;
}

} // namespace detection
