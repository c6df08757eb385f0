#include "gt/display/Magnitude.hpp"
#include "gt/String.hpp"

#include <cmath>

namespace Geotime {
namespace Magnitude {

// Global variables

static const char* const suffixes[] = { "", "K", "M", "B", "T", "P", "E", "Z", "Y" };

constexpr uint32_t suffixCount = sizeof(suffixes) / sizeof(suffixes[0]);

// Functions

std::string Format(double value) {
    uint32_t scale = 0;

    // Compare the value as it will print, so 999999 becomes "1.00 M" rather than "1000.00 K".
    while (std::round(value * 100.0) >= 100000.0 && scale < suffixCount - 1) {
        value /= 1000.0;
        scale++;
    }

    char buffer[64];

    if (scale == 0) {
        String::Format(buffer, sizeof(buffer), "%.2f", value);
    } else {
        String::Format(buffer, sizeof(buffer), "%.2f %s", value, suffixes[scale]);
    }

    return std::string(buffer);
}

} // namespace Magnitude
} // namespace Geotime
