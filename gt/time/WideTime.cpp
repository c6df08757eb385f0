#include "gt/time/WideTime.hpp"
#include "gt/time/Time.hpp"
#include "gt/String.hpp"

#include <limits>

namespace Geotime {

// Factories

WideTime WideTime::FromNarrow(int32_t ms) {
    return WideTime(static_cast<int128_t>(ms));
}

WideTime WideTime::FromNarrow(int64_t ms) {
    return WideTime(static_cast<int128_t>(ms));
}

WideTime WideTime::FromWide(int128_t ms) {
    return WideTime(ms);
}

WideTime WideTime::FromInstant(const Time::Instant& instant) {
    auto nanos = static_cast<int128_t>(instant.seconds) * GT_NSEC_PER_SEC + static_cast<int128_t>(instant.nsec);
    // Integer division truncates toward zero.
    return WideTime(nanos / GT_NSEC_PER_MSEC);
}

WideTime WideTime::Now() {
    return WideTime::FromInstant(Time::GetTimestamp());
}

// Classes

WideTime::WideTime() {
    this->ms = 0;
}

WideTime::WideTime(int128_t ms) {
    this->ms = ms;
}

int128_t WideTime::Value() const {
    return this->ms;
}

size_t WideTime::Hash() const {
    auto bits = static_cast<uint128_t>(this->ms);
    auto lo   = static_cast<uint64_t>(bits);
    auto hi   = static_cast<uint64_t>(bits >> 64);

    auto h = std::hash<uint64_t>()(lo);
    h ^= std::hash<uint64_t>()(hi) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

bool WideTime::ToMillis(int64_t& millis, Error::Record* error) const {
    if (this->ms < static_cast<int128_t>(std::numeric_limits<int64_t>::min())
        || this->ms > static_cast<int128_t>(std::numeric_limits<int64_t>::max())) {
        char digits[GT_STRING_INT128_SIZE];
        String::FromInt128(this->ms, digits, sizeof(digits));
        GT_SET_ERROR_MSG(error, Error::Range, "%s ms out of 64-bit range", digits);
        return false;
    }

    millis = static_cast<int64_t>(this->ms);
    return true;
}

bool WideTime::ToInstant(Time::Instant& instant, Error::Record* error) const {
    int64_t millis;
    if (!this->ToMillis(millis, error)) {
        Error::Convert(error, Error::Conversion);
        return false;
    }

    // Floor the seconds so the millisecond remainder stays non-negative before the epoch.
    auto seconds   = millis / GT_MSEC_PER_SEC;
    auto remainder = millis % GT_MSEC_PER_SEC;
    if (remainder < 0) {
        remainder += GT_MSEC_PER_SEC;
        seconds--;
    }

    return Time::MakeInstant(seconds, static_cast<uint32_t>(remainder), instant, error);
}

std::string WideTime::Describe() const {
    char digits[GT_STRING_INT128_SIZE];
    String::FromInt128(this->ms, digits, sizeof(digits));

    std::string result("WideTime(");
    result += digits;
    result += ")";
    return result;
}

// Functions

std::ostream& operator<<(std::ostream& stream, const WideTime& time) {
    return stream << time.Describe();
}

} // namespace Geotime
