#include "DetectionTypes.hpp"
#include "TextUtils.hpp"

#include <stdexcept>

namespace detection
{

DetectedField::DetectedField(std::string label_in, std::string value_in, double confidence_in, std::size_t line)
    : label(trim(label_in))
    , value(trim(value_in))
    , confidence(confidence_in)
    , line_number(line)
{
    if (label.empty())
        throw std::invalid_argument("DetectedField label must not be empty");
    if (value.empty())
        throw std::invalid_argument("DetectedField value must not be empty");
    if (!(confidence >= 0.0 && confidence <= 1.0))
        throw std::invalid_argument("DetectedField confidence must be within [0, 1]");
}

} // namespace detection
