#include <basic/ray.h>

namespace lre {

Ray::Ray(const Point4 &origin, const Vec4 &direction) : origin(origin), direction(direction) {
}

Point4 Ray::position(double t) const {
	return origin + direction * t;
}

Ray Ray::transformed(const Mat4 &m) const {
	return Ray(m * origin, m * direction);
}

Ray operator*(const Mat4 &m, const Ray &ray) {
	return ray.transformed(m);
}

}
