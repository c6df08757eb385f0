#ifndef GT_TIME_HPP
#define GT_TIME_HPP

#include "gt/time/Time.hpp"
#include "gt/time/Types.hpp"
#include "gt/time/WideTime.hpp"

#endif
