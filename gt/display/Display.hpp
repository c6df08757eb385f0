#ifndef GT_DISPLAY_DISPLAY_HPP
#define GT_DISPLAY_DISPLAY_HPP

#include "gt/time/WideTime.hpp"

#include <string>

// Rough year used for out-of-calendar magnitudes: 356 days.
#define GT_DISPLAY_MSEC_PER_YEAR (356.0 * 24.0 * 60.0 * 60.0 * 1000.0)

// Year counts at or past this are printed as raw milliseconds.
#define GT_DISPLAY_YEAR_CEILING 1.0e12

namespace Geotime {
namespace Display {

// Human-readable time. Uses the strftime pattern when the time is within the calendar
// range, otherwise an approximate year count ("29.99 B years ago"), otherwise the raw
// value ("WideTime(...) ms ago"). Never fails.
std::string Format(const WideTime& time, const char* pattern);

} // namespace Display
} // namespace Geotime

#endif
