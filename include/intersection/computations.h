#ifndef LRE_INCLUDE_INTERSECTION_COMPUTATIONS_H
#define LRE_INCLUDE_INTERSECTION_COMPUTATIONS_H

#include <basic/ray.h>
#include <basic/vec4.h>
#include <intersection/intersection.h>
#include <object/object_set.h>

namespace lre {

// Everything the shading step needs to know about one hit.
struct Computations {
	double t;
	ObjectId object;
	Point4 point; // Hit point on the surface
	Point4 over_point; // point moved by EPSILON along the normal, origin of the shadow ray
	Vec4 eye; // Negated ray direction
	Vec4 normal; // Flipped to face the eye when the hit is inside the object
	bool inside;

	// Throws NonInvertibleMatrix if the object transform is singular.
	static Computations prepare(const Intersection &hit, const Ray &ray, const ObjectSet &objects);
};

}

#endif
