#include "gt/Debug.hpp"

#include <cstdio>
#include <cstdlib>

namespace Geotime {
namespace Debug {

void AssertionFailed(const char* expr, const char* file, int32_t line) {
    ::fprintf(stderr, "gt: assertion failed: %s (%s:%d)\n", expr, file, static_cast<int>(line));
    ::fflush(stderr);
    ::abort();
}

} // namespace Debug
} // namespace Geotime
