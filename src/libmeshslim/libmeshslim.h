#ifndef _libmeshslim_h_
#define _libmeshslim_h_

#include <array>
#include <algorithm>
#include <cstdint>
#include <vector>
#include <cmath>
#include <type_traits>

// Tolerance for comparing coordinates and normalized vectors.
static constexpr double EPSILON = 1e-4;

#endif // _libmeshslim_h_
