#ifndef LRE_INCLUDE_OBJECT_OBJECT_H
#define LRE_INCLUDE_OBJECT_OBJECT_H

#include <basic/color.h>
#include <basic/ray.h>
#include <basic/vec4.h>
#include <material/material.h>
#include <transform/transformation.h>
#include <vector>

namespace lre {

// T-values of the intersections between a ray and an object
using TValues = std::vector<double>;

// Object base class
class Object {
protected:
	// Declare the constructor in protected section.
	Object() = default;

public:
	// Constructors
	Object(const Object &) = delete; // Delete the copy constructor
	Object &operator=(const Object &) = delete;
	Object(Object &&) = delete; // Delete the move constructor
	Object &operator=(Object &&) = delete;

	// Destructor
	virtual ~Object();

	// Shared state
	const Transformation &transform() const;
	void set_transform(const Transformation &transform);
	void add_transform(const TransformUnit &unit);

	const Material &material() const;
	Material &material();
	void set_material(const Material &material);

	// World space intersection: the ray is mapped into object space by the inverse transform
	// and handed to local_intersect. Throws NonInvertibleMatrix.
	TValues intersect(const Ray &world_ray) const;

	// World space normal: local_normal mapped back by the inverse-transpose, w forced to 0, normalized.
	// Throws NonInvertibleMatrix.
	Vec4 normal(const Point4 &world_point) const;

	// Surface color at a world point, from the material pattern if there is one.
	Color color_at(const Point4 &world_point) const;

	// Virtual function interface declaration

	// Function to get the t-values of an object space ray.
	virtual TValues local_intersect(const Ray &object_ray) const;

	// Function to get the normal at an object space point.
	virtual Vec4 local_normal(const Point4 &object_point) const;

private:
	Transformation transform_;
	Material material_;
};

}

#endif
