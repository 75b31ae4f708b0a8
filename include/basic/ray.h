#ifndef LRE_INCLUDE_BASIC_RAY_H
#define LRE_INCLUDE_BASIC_RAY_H

#include <basic/matrix.h>
#include <basic/vec4.h>

namespace lre {

struct Ray {
	Point4 origin;
	Vec4 direction;

	// Constructors
	Ray() = default;
	Ray(const Point4 &origin, const Vec4 &direction); // direction is kept as given, not normalized

	// Get point at parameter t along the ray
	Point4 position(double t) const;

	// Map origin and direction by the same matrix. Translation does not affect the direction (w = 0).
	Ray transformed(const Mat4 &m) const;
};

Ray operator*(const Mat4 &m, const Ray &ray);

}

#endif
