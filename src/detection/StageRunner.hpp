#pragma once

#include "DetectionTypes.hpp"
#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <plog/Log.h>

namespace detection {

// Runs one detection stage. Exceptions never leave: they are logged on the
// detection trace, reported as warnings under `category` and returned as a
// failed StageResult so the caller can degrade to an empty result.
template<typename T, typename Fn>
StageResult<T> run_stage(std::string_view stage_name, Fn&& fn,
                         utils::ErrorCategory category = utils::ErrorCategory::Extraction)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    StageResult<T> out;
    out.stage_name = std::string(stage_name);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [start]() {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    };

    try
    {
        out.value.emplace(std::invoke(std::forward<Fn>(fn)));
        out.duration = elapsed();
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[FormFieldDetector] stage=" << stage_name << " ok in "
                                                   << out.duration.count() << "us";
        }
        return out;
    }
    catch (const std::exception& ex)
    {
        out.error = ex.what();
    }
    catch (...)
    {
        out.error = "unknown exception";
    }

    out.duration = elapsed();
    PLOG_ERROR_(Diagnostics::kLogInstance) << "[FormFieldDetector] stage=" << stage_name << " failed after "
                                           << out.duration.count() << "us: " << out.error;
    utils::ErrorReporter::ReportWarning(category, "Detection stage failed", out.stage_name + ": " + out.error);
    return out;
}

} // namespace detection
