#ifndef GT_STRING_HPP
#define GT_STRING_HPP

#include "gt/Types.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstdarg>

// Longest signed 128-bit decimal, with sign and null byte.
#define GT_STRING_INT128_SIZE 41

namespace Geotime {
namespace String {

// Functions
int32_t Copy(char* dst, const char* src, size_t len);

void Format(char* dest, size_t capacity, const char* format, ...);

// Write the signed decimal form of value. Returns the number of characters written.
size_t FromInt128(int128_t value, char* dest, size_t capacity);

void MemCopy(void* dst, const void* src, size_t len);

void VFormat(char* dst, size_t capacity, const char* format, va_list args);

} // namespace String
} // namespace Geotime

#endif
