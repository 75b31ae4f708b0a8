#ifndef LRE_INCLUDE_OBJECT_PLANE_H
#define LRE_INCLUDE_OBJECT_PLANE_H

#include <basic/ray.h>
#include <basic/vec4.h>
#include <object/object.h>

namespace lre {

// Infinite plane through the local origin, extending in x and z, normal (0, 1, 0).
class Plane : public Object {
public:
	Plane() = default;

	// Destructors
	~Plane() override = default;

	// A parallel (or coplanar) ray never hits.
	TValues local_intersect(const Ray &object_ray) const override;

	Vec4 local_normal(const Point4 &object_point) const override;
};

}

#endif
