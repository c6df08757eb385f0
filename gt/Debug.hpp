#ifndef GT_DEBUG_HPP
#define GT_DEBUG_HPP

#include <cstdint>

// Internal invariants only. Input validation reports through Error::Record instead.
#if defined(NDEBUG)
#define GT_ASSERT(expr) \
    do { (void)sizeof(expr); } while (0)
#else
#define GT_ASSERT(expr) \
    do { \
        if (!(expr)) { \
            ::Geotime::Debug::AssertionFailed(#expr, __FILE__, __LINE__); \
        } \
    } while (0)
#endif

namespace Geotime {
namespace Debug {

[[noreturn]] void AssertionFailed(const char* expr, const char* file, int32_t line);

} // namespace Debug
} // namespace Geotime

#endif
