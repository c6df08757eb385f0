#ifndef GT_DISPLAY_MAGNITUDE_HPP
#define GT_DISPLAY_MAGNITUDE_HPP

#include <string>

namespace Geotime {
namespace Magnitude {

// Scale a non-negative value by powers of 1000 and print it with two decimals and
// a K/M/B/T/P/E/Z/Y suffix, e.g. "299.87 M". Values below 1000 carry no suffix.
std::string Format(double value);

} // namespace Magnitude
} // namespace Geotime

#endif
