#ifndef GT_TIME_TIME_HPP
#define GT_TIME_TIME_HPP

#include "gt/Error.hpp"
#include "gt/time/Types.hpp"

#include <cstdint>
#include <string>

#if defined(GT_SYSTEM_WIN)
#include <windows.h>
#endif

namespace Geotime {
namespace Time {

// True if the instant lies inside the calendar range and its sub-second part is normalized.
bool      IsValidInstant(const Instant& instant);

// Build an instant from whole seconds and a millisecond remainder (0-999).
bool      MakeInstant(int64_t seconds, uint32_t millis, Instant& instant, Error::Record* error = nullptr);

#if defined(GT_SYSTEM_WIN)
// Win32 FILETIME to instant
Instant   FromWinFiletime(const FILETIME* ft);
void      ToWinFiletime(const Instant& instant, FILETIME* ft);
#endif

Instant   GetTimestamp();

bool      MakeTime(const TimeRec& date, Instant& instant, Error::Record* error = nullptr);

// instant must be valid (IsValidInstant).
void      BreakTime(const Instant& instant, TimeRec& date);

// Render with a strftime pattern (%Y, %m, %d, %H, %M, %S, ...) in UTC, whatever the process
// time zone: %s, %z and %Z are resolved against UTC. Fails only for a null pattern or an
// invalid instant.
bool      FormatTime(const Instant& instant, const char* pattern, std::string& result, Error::Record* error = nullptr);

} // namespace Time
} // namespace Geotime

#endif
