#ifndef GT_DISPLAY_HPP
#define GT_DISPLAY_HPP

#include "gt/display/Display.hpp"
#include "gt/display/Magnitude.hpp"

#endif
