#include "gt/String.hpp"

#include <cstdio>
#include <cstring>

namespace Geotime {
namespace String {

// Copy at most len - 1 characters and always null-terminate. Returns the copied length.
int32_t Copy(char* dst, const char* src, size_t len) {
    if (dst == nullptr || len == 0) {
        return 0;
    }

    if (src == nullptr) {
        *dst = '\0';
        return 0;
    }

    size_t i = 0;
    while (i < len - 1 && src[i] != '\0') {
        dst[i] = src[i];
        i++;
    }

    dst[i] = '\0';
    return static_cast<int32_t>(i);
}

void Format(char* dest, size_t capacity, const char* format, ...) {
    va_list args;
    va_start(args, format);
    VFormat(dest, capacity, format, args);
    va_end(args);
}

size_t FromInt128(int128_t value, char* dest, size_t capacity) {
    if (dest == nullptr || capacity == 0) {
        return 0;
    }

    // Work on the magnitude as unsigned so that the minimum value does not overflow.
    bool      negative  = value < 0;
    uint128_t magnitude = negative ? (~static_cast<uint128_t>(value) + 1) : static_cast<uint128_t>(value);

    char digits[GT_STRING_INT128_SIZE];
    size_t count = 0;

    do {
        digits[count++] = static_cast<char>('0' + static_cast<int32_t>(magnitude % 10));
        magnitude /= 10;
    } while (magnitude != 0);

    size_t needed = count + (negative ? 1 : 0);
    if (needed + 1 > capacity) {
        *dest = '\0';
        return 0;
    }

    size_t w = 0;
    if (negative) {
        dest[w++] = '-';
    }

    while (count > 0) {
        dest[w++] = digits[--count];
    }

    dest[w] = '\0';
    return w;
}

void MemCopy(void* dst, const void* src, size_t len) {
    ::memmove(dst, src, len);
}

void VFormat(char* dst, size_t capacity, const char* format, va_list args) {
    if (dst == nullptr || capacity == 0) {
        return;
    }

    if (format == nullptr) {
        *dst = '\0';
        return;
    }

    ::vsnprintf(dst, capacity, format, args);
}

} // namespace String
} // namespace Geotime
