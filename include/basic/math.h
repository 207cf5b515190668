#ifndef PRT_INCLUDE_BASIC_MATH_H
#define PRT_INCLUDE_BASIC_MATH_H

namespace prt {

constexpr double PI = 3.14159265358979323846;

// Distance a secondary ray origin is pushed off the surface it starts from
constexpr double ORIGIN_BIAS = 1e-4;

// Deepest recursion level that still traces (levels 0..MAX_DEPTH)
constexpr int MAX_DEPTH = 3;

}

#endif
