#ifndef LRE_INCLUDE_OBJECT_SPHERE_H
#define LRE_INCLUDE_OBJECT_SPHERE_H

#include <basic/ray.h>
#include <basic/vec4.h>
#include <object/object.h>

namespace lre {

// Sphere object class, derived from class Object.
class Sphere : public Object {
public:
	// Constructor to initialize a Sphere object. Defaults to the unit sphere at the origin.
	Sphere();
	Sphere(const Point4 &center, double radius);

	// Destructors
	~Sphere() override = default;

	// Both roots of the ray-sphere quadratic, or none.
	// Throws DivisionByZero for a zero-length ray direction.
	TValues local_intersect(const Ray &object_ray) const override;

	// object_point - center, not normalized.
	Vec4 local_normal(const Point4 &object_point) const override;

	const Point4 &center() const;
	double radius() const;

private:
	// Object properties
	Point4 center_;
	double radius_;
};

}

#endif
