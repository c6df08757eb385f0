#include "gt/time/system/System_Time.hpp"

#include <ctime>

namespace Geotime {
namespace System_Time {

Time::Instant Now() {
    struct timespec ts = {};
    ::clock_gettime(CLOCK_REALTIME, &ts);

    Time::Instant instant;
    instant.seconds = static_cast<int64_t>(ts.tv_sec);
    instant.nsec    = static_cast<uint32_t>(ts.tv_nsec);
    return instant;
}

} // namespace System_Time
} // namespace Geotime
