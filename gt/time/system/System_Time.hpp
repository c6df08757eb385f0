#ifndef GT_TIME_SYSTEM_SYSTEM_TIME_HPP
#define GT_TIME_SYSTEM_SYSTEM_TIME_HPP

#include "gt/time/Types.hpp"

namespace Geotime {
namespace System_Time {

// Current UTC wall clock time.
Time::Instant Now();

} // namespace System_Time
} // namespace Geotime

#endif
