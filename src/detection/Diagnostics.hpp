#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace detection
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line rendering for log records: line breaks escaped, other control
    // characters masked, cut at MaxPreview() bytes without splitting a code point.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static bool isControl(char ch) noexcept;
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace detection
