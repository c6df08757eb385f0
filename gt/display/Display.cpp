#include "gt/display/Display.hpp"
#include "gt/display/Magnitude.hpp"
#include "gt/time/Time.hpp"

#include <cmath>

namespace Geotime {
namespace Display {

std::string Format(const WideTime& time, const char* pattern) {
    Time::Instant instant;
    std::string   result;

    if (time.ToInstant(instant) && Time::FormatTime(instant, pattern, result)) {
        return result;
    }

    auto years = static_cast<double>(time.Value()) / GT_DISPLAY_MSEC_PER_YEAR;
    auto sign  = years < 0.0 ? "ago" : "from now";
    years = std::fabs(years);

    if (years < GT_DISPLAY_YEAR_CEILING) {
        result = Magnitude::Format(years);
        result += " years ";
    } else {
        // Past this point the year estimate is no longer meaningful.
        result = time.Describe();
        result += " ms ";
    }

    result += sign;
    return result;
}

} // namespace Display
} // namespace Geotime
