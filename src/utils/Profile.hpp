#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Scope timing for the detection stages. FORMSCAN_PROFILING_LEVEL comes from CMake:
//   0  macros compile to nothing
//   1  each scope logs its wall time to the profiling logger
//   2  level 1 plus Tracy zones

#ifndef FORMSCAN_PROFILING_LEVEL
#define FORMSCAN_PROFILING_LEVEL 0
#endif

#if FORMSCAN_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if FORMSCAN_PROFILING_LEVEL >= 1
#include <plog/Log.h>

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " " << micros.count() << "us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

#if FORMSCAN_PROFILING_LEVEL >= 2
// Tracy zone names carry a 16-bit length.
inline constexpr std::uint16_t zoneNameLength(std::size_t length) noexcept
{
    return length > 0xFFFF ? static_cast<std::uint16_t>(0xFFFF) : static_cast<std::uint16_t>(length);
}
#endif

} // namespace profiling

#define FORMSCAN_PROFILE_CONCAT_INNER(a, b) a##b
#define FORMSCAN_PROFILE_CONCAT(a, b) FORMSCAN_PROFILE_CONCAT_INNER(a, b)
#define FORMSCAN_PROFILE_TIMER(nameExpr) \
    ::profiling::ScopeTimer FORMSCAN_PROFILE_CONCAT(profile_timer_, __LINE__)(nameExpr)

#if FORMSCAN_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                                  \
    ZoneScoped;                                                                                         \
    FORMSCAN_PROFILE_TIMER(nameExpr);                                                                   \
    if (std::string_view profile_zone_name{ nameExpr }; !profile_zone_name.empty())                     \
    {                                                                                                   \
        ZoneName(profile_zone_name.data(), ::profiling::zoneNameLength(profile_zone_name.size()));      \
    }
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScoped;                  \
    FORMSCAN_PROFILE_TIMER(__func__)
#else
#define PROFILE_SCOPE_CUSTOM(nameExpr) FORMSCAN_PROFILE_TIMER(nameExpr)
#define PROFILE_SCOPE_FUNCTION() FORMSCAN_PROFILE_TIMER(__func__)
#endif

#else

#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_SCOPE_FUNCTION() ((void)0)

#endif
