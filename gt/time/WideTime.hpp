#ifndef GT_TIME_WIDE_TIME_HPP
#define GT_TIME_WIDE_TIME_HPP

#include "gt/Error.hpp"
#include "gt/time/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace Geotime {

// WideTime - signed 128-bit milliseconds starting from 0 == January 1 1970 00:00:00 GMT.
// Every 128-bit value is a legal WideTime.
class WideTime {
    public:
        static WideTime FromNarrow(int32_t ms);
        static WideTime FromNarrow(int64_t ms);
        static WideTime FromWide(int128_t ms);
        // Sub-millisecond precision is truncated toward zero.
        static WideTime FromInstant(const Time::Instant& instant);
        static WideTime Now();

        WideTime();
        explicit WideTime(int128_t ms);

        int128_t    Value() const;
        size_t      Hash() const;

        // Fails with Error::Range when the value does not fit in 64 bits.
        bool        ToMillis(int64_t& millis, Error::Record* error = nullptr) const;

        // Fails with Error::Conversion when the value is outside the calendar range.
        bool        ToInstant(Time::Instant& instant, Error::Record* error = nullptr) const;

        // WideTime(<ms>)
        std::string Describe() const;

        bool operator==(const WideTime& other) const { return this->ms == other.ms; }
        bool operator!=(const WideTime& other) const { return this->ms != other.ms; }
        bool operator<(const WideTime& other) const { return this->ms < other.ms; }
        bool operator<=(const WideTime& other) const { return this->ms <= other.ms; }
        bool operator>(const WideTime& other) const { return this->ms > other.ms; }
        bool operator>=(const WideTime& other) const { return this->ms >= other.ms; }

    private:
        int128_t ms;
};

std::ostream& operator<<(std::ostream& stream, const WideTime& time);

} // namespace Geotime

namespace std {

template<>
struct hash<Geotime::WideTime> {
    size_t operator()(const Geotime::WideTime& time) const {
        return time.Hash();
    }
};

} // namespace std

#endif
