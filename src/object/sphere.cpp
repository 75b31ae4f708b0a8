#include <basic/error.h>
#include <basic/math.h>
#include <cmath>
#include <object/sphere.h>
#include <stdexcept>

namespace lre {

Sphere::Sphere() : center_(point(0.0, 0.0, 0.0)), radius_(1.0) {
}

Sphere::Sphere(const Point4 &center, double radius) : center_(center), radius_(radius) {
	if (!(radius > 0.0)) {
		throw std::invalid_argument("Sphere radius must be positive");
	}
}

TValues Sphere::local_intersect(const Ray &object_ray) const {
	const Vec4 delta = object_ray.origin - center_;

	// c * t^2 + 2 * b * t + a = 0
	const double a = dot(delta, delta) - radius_ * radius_;
	const double b = dot(object_ray.direction, delta);
	const double c = dot(object_ray.direction, object_ray.direction);
	if (std::fabs(c) < EPSILON) {
		throw DivisionByZero("Sphere intersection with a zero-length ray direction");
	}

	const double discriminant = b * b - a * c;
	if (discriminant < 0.0) {
		return {};
	}

	const double root = std::sqrt(discriminant);
	return { (-b - root) / c, (-b + root) / c };
}

Vec4 Sphere::local_normal(const Point4 &object_point) const {
	return object_point - center_;
}

const Point4 &Sphere::center() const {
	return center_;
}

double Sphere::radius() const {
	return radius_;
}

}
