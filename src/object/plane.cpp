#include <basic/math.h>
#include <cmath>
#include <object/plane.h>

namespace lre {

TValues Plane::local_intersect(const Ray &object_ray) const {
	if (std::fabs(object_ray.direction.y()) < EPSILON) {
		return {};
	}

	return { -object_ray.origin.y() / object_ray.direction.y() };
}

Vec4 Plane::local_normal(const Point4 &object_point) const {
	return vector(0.0, 1.0, 0.0);
}

}
