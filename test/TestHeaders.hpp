#ifndef __ARCHTUI_TEST_HEADERS__
#define __ARCHTUI_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>

#endif  // __ARCHTUI_TEST_HEADERS__
