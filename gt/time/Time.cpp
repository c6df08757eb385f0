#include "gt/time/Time.hpp"
#include "gt/time/system/System_Time.hpp"
#include "gt/Debug.hpp"

#include <ctime>
#include <vector>

namespace Geotime {
namespace Time {

// Global variables

#if defined(GT_SYSTEM_WIN)
// amount of win32 filetime units in a second
constexpr int64_t win32filetimeUnitsPerSec    = (GT_NSEC_PER_SEC / 100LL);
// the FILETIME value needed to move from 1601 epoch to the 1970 epoch
constexpr int64_t win32filetimeUnixDifference = 116444736000000000LL;
#endif

// 1970-01-01 was a Thursday.
constexpr int64_t epochWeekday = 4;

// Local functions

static int64_t floorDiv(int64_t a, int64_t b) {
    auto q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

static bool isLeapYear(int64_t year) {
    return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
}

static int32_t daysInMonth(int64_t year, int32_t month) {
    static const int32_t days[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

    if (month == 2 && isLeapYear(year)) {
        return 29;
    }

    return days[month - 1];
}

// Days since 1970-01-01 of a proleptic Gregorian date.
static int64_t daysFromCivil(int64_t year, int32_t month, int32_t day) {
    year -= month <= 2 ? 1 : 0;

    auto era = (year >= 0 ? year : year - 399) / 400;
    auto yoe = year - era * 400;
    auto doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    auto doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;

    return era * 146097 + doe - 719468;
}

static void civilFromDays(int64_t days, int64_t& year, int32_t& month, int32_t& day) {
    days += 719468;

    auto era = (days >= 0 ? days : days - 146096) / 146097;
    auto doe = days - era * 146097;
    auto yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    auto mp  = (5 * doy + 2) / 153;

    day   = static_cast<int32_t>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int32_t>(mp < 10 ? mp + 3 : mp - 9);
    year  = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

static int64_t minSeconds() {
    return daysFromCivil(GT_TIME_MIN_YEAR, 1, 1) * GT_SEC_PER_DAY;
}

static int64_t maxSeconds() {
    return daysFromCivil(GT_TIME_MAX_YEAR, 12, 31) * GT_SEC_PER_DAY + (GT_SEC_PER_DAY - 1);
}

static bool isConversionModifier(char ch) {
    switch (ch) {
    case '_':
    case '-':
    case '^':
    case '#':
    case 'E':
    case 'O':
        return true;
    default:
        return ch >= '0' && ch <= '9';
    }
}

// Replace the conversions that strftime would resolve against the local zone (%s, %z, %Z)
// with their UTC text. Everything else, including flags and %%, is left for strftime.
static std::string expandZoneConversions(const char* pattern, int64_t seconds) {
    std::string expanded;

    for (auto p = pattern; *p != '\0'; p++) {
        if (*p != '%') {
            expanded += *p;
            continue;
        }

        // Flags, field width and E/O modifiers
        auto q = p + 1;
        while (*q != '\0' && isConversionModifier(*q)) {
            q++;
        }

        switch (*q) {
        case 's': {
            char digits[24];
            String::Format(digits, sizeof(digits), "%lld", static_cast<long long>(seconds));
            expanded += digits;
            p = q;
            break;
        }
        case 'z':
            expanded += "+0000";
            p = q;
            break;
        case 'Z':
            expanded += "UTC";
            p = q;
            break;
        case '\0':
            expanded.append(p, q);
            p = q - 1;
            break;
        default:
            expanded.append(p, q + 1);
            p = q;
            break;
        }
    }

    return expanded;
}

// Functions

bool IsValidInstant(const Instant& instant) {
    return instant.nsec < GT_NSEC_PER_SEC
        && instant.seconds >= minSeconds()
        && instant.seconds <= maxSeconds();
}

bool MakeInstant(int64_t seconds, uint32_t millis, Instant& instant, Error::Record* error) {
    if (millis >= GT_MSEC_PER_SEC) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "sub-second milliseconds out of range: %u", millis);
        return false;
    }

    Instant candidate;
    candidate.seconds = seconds;
    candidate.nsec    = millis * static_cast<uint32_t>(GT_NSEC_PER_MSEC);

    if (!IsValidInstant(candidate)) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "seconds out of calendar range: %lld", static_cast<long long>(seconds));
        return false;
    }

    instant = candidate;
    return true;
}

#if defined(GT_SYSTEM_WIN)

// Win32 FILETIME to instant
Instant FromWinFiletime(const FILETIME* ft) {
    // 1601 (Gregorian) 100-nsec
    auto gregorian = (static_cast<uint64_t>(ft->dwHighDateTime) << 32ULL) | static_cast<uint64_t>(ft->dwLowDateTime);
    // Convert filetime from 1601 epoch to 1970 epoch.
    auto unixTicks = static_cast<int64_t>(gregorian) - win32filetimeUnixDifference;

    Instant instant;
    instant.seconds = floorDiv(unixTicks, win32filetimeUnitsPerSec);
    // Convert remaining 100-nsec intervals into nsec
    instant.nsec    = static_cast<uint32_t>((unixTicks - instant.seconds * win32filetimeUnitsPerSec) * 100LL);
    return instant;
}

void ToWinFiletime(const Instant& instant, FILETIME* ft) {
    auto gregorian = static_cast<uint64_t>(instant.seconds * win32filetimeUnitsPerSec
        + static_cast<int64_t>(instant.nsec / 100U)
        + win32filetimeUnixDifference);

    ft->dwLowDateTime  = static_cast<DWORD>(gregorian);
    ft->dwHighDateTime = static_cast<DWORD>(gregorian >> 32ULL);
}

#endif

Instant GetTimestamp() {
    return System_Time::Now();
}

bool MakeTime(const TimeRec& date, Instant& instant, Error::Record* error) {
    if (date.year < GT_TIME_MIN_YEAR || date.year > GT_TIME_MAX_YEAR) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "year out of calendar range: %d", date.year);
        return false;
    }

    if (date.month < 1 || date.month > 12) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "invalid month: %d", date.month);
        return false;
    }

    if (date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "invalid day: %04d-%02d-%02d", date.year, date.month, date.day);
        return false;
    }

    if (date.hour < 0 || date.hour > 23 || date.min < 0 || date.min > 59 || date.sec < 0 || date.sec > 59) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "invalid time of day: %02d:%02d:%02d", date.hour, date.min, date.sec);
        return false;
    }

    if (date.nsec >= GT_NSEC_PER_SEC) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "invalid nanoseconds: %u", date.nsec);
        return false;
    }

    auto days = daysFromCivil(date.year, date.month, date.day);

    instant.seconds = days * GT_SEC_PER_DAY + date.hour * 3600LL + date.min * 60LL + date.sec;
    instant.nsec    = date.nsec;

    return true;
}

void BreakTime(const Instant& instant, TimeRec& date) {
    // Outside the calendar range the year no longer fits a TimeRec.
    GT_ASSERT(IsValidInstant(instant));

    auto days   = floorDiv(instant.seconds, GT_SEC_PER_DAY);
    auto secOfDay = instant.seconds - days * GT_SEC_PER_DAY;

    int64_t year;
    civilFromDays(days, year, date.month, date.day);

    date.year = static_cast<int32_t>(year);
    date.hour = static_cast<int32_t>(secOfDay / 3600);
    date.min  = static_cast<int32_t>((secOfDay % 3600) / 60);
    date.sec  = static_cast<int32_t>(secOfDay % 60);
    date.nsec = instant.nsec;
}

bool FormatTime(const Instant& instant, const char* pattern, std::string& result, Error::Record* error) {
    if (pattern == nullptr) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "null format pattern");
        return false;
    }

    if (!IsValidInstant(instant)) {
        GT_SET_ERROR_MSG(error, Error::Conversion, "instant out of calendar range: %lld", static_cast<long long>(instant.seconds));
        return false;
    }

    if (*pattern == '\0') {
        result.clear();
        return true;
    }

    TimeRec date;
    BreakTime(instant, date);

    auto days = floorDiv(instant.seconds, GT_SEC_PER_DAY);

    std::tm tm = {};
    tm.tm_year  = date.year - 1900;
    tm.tm_mon   = date.month - 1;
    tm.tm_mday  = date.day;
    tm.tm_hour  = date.hour;
    tm.tm_min   = date.min;
    tm.tm_sec   = date.sec;
    tm.tm_wday  = static_cast<int>(days + epochWeekday - floorDiv(days + epochWeekday, 7) * 7);
    tm.tm_yday  = static_cast<int>(days - daysFromCivil(date.year, 1, 1));
    tm.tm_isdst = 0;
#if defined(__GLIBC__) || defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
    tm.tm_gmtoff = 0;
    tm.tm_zone   = const_cast<char*>("UTC");
#endif

    auto utcPattern = expandZoneConversions(pattern, instant.seconds);

    // strftime returns 0 both for "did not fit" and for empty output, so grow up to a bound
    // no legitimate expansion of this pattern can reach.
    auto limit = (utcPattern.size() + 1) * GT_TIME_FORMAT_SIZE;

    for (size_t capacity = GT_TIME_FORMAT_SIZE; capacity <= limit; capacity *= 2) {
        std::vector<char> buffer(capacity);
        auto len = ::strftime(buffer.data(), buffer.size(), utcPattern.c_str(), &tm);
        if (len != 0) {
            result.assign(buffer.data(), len);
            return true;
        }
    }

    result.clear();
    return true;
}

} // namespace Time
} // namespace Geotime
