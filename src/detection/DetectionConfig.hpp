#pragma once

#include <cstddef>

namespace detection
{

// Hard limits and scoring threshold for one detection run.
// Defaults are the production values; config can only tighten or relax them within range.
struct DetectionConfig
{
    std::size_t max_text_bytes = 10 * 1024 * 1024; // total input cap (10 MiB)
    std::size_t max_lines = 10000;                 // lines kept after splitting
    std::size_t max_line_length = 1000;            // code points per line fed to the matcher
    double confidence_threshold = 0.5;             // fields must score strictly above this
    bool normalize_unicode = true;                 // NFKC before splitting
};

} // namespace detection
