#ifndef GT_TIME_TYPES_HPP
#define GT_TIME_TYPES_HPP

#include "gt/Types.hpp"

#include <cstdint>

#define GT_MSEC_PER_SEC  1000LL
#define GT_NSEC_PER_MSEC 1000000LL
#define GT_NSEC_PER_SEC  1000000000LL
#define GT_SEC_PER_DAY   86400LL

// Calendar range of an Instant, in proleptic Gregorian years.
#define GT_TIME_MIN_YEAR -262144
#define GT_TIME_MAX_YEAR 262143

#define GT_TIME_FORMAT_SIZE 256

namespace Geotime {

namespace Time {

// Instant - a UTC point in time: seconds starting from 0 == January 1 1970 00:00:00 GMT,
// plus a sub-second part that is always non-negative.
class Instant {
    public:
        int64_t  seconds;
        uint32_t nsec;
};

class TimeRec {
    public:
        int32_t  year;
        int32_t  month;
        int32_t  day;
        int32_t  hour;
        int32_t  min;
        int32_t  sec;
        uint32_t nsec;
};

} // namespace Time
} // namespace Geotime

#endif
