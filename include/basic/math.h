#ifndef LRE_INCLUDE_BASIC_MATH_H
#define LRE_INCLUDE_BASIC_MATH_H

namespace lre {

// Tolerance used by every floating point comparison and for the shadow over-point offset
constexpr double EPSILON = 1e-4;

// A small epsilon value for pivots during matrix inversion
constexpr double GEOMETRY_EPSILON = 1e-12;

// Compares two numbers with EPSILON precision
bool feq(double a, double b);

}

#endif
