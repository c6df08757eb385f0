#include "gt/time/system/System_Time.hpp"
#include "gt/time/Time.hpp"

#include <windows.h>

namespace Geotime {
namespace System_Time {

Time::Instant Now() {
    FILETIME ft;
    ::GetSystemTimePreciseAsFileTime(&ft);
    return Time::FromWinFiletime(&ft);
}

} // namespace System_Time
} // namespace Geotime
