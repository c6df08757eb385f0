#ifndef GT_TYPES_HPP
#define GT_TYPES_HPP

namespace Geotime {

typedef __int128          int128_t;
typedef unsigned __int128 uint128_t;

} // namespace Geotime

#endif
