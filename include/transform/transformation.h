#ifndef LRE_INCLUDE_TRANSFORM_TRANSFORMATION_H
#define LRE_INCLUDE_TRANSFORM_TRANSFORMATION_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <basic/vec4.h>
#include <initializer_list>
#include <transform/transform_unit.h>
#include <vector>

namespace lre {

// Ordered sequence of transform units composed into one cached matrix.
// Units are applied in the order they were added: the first added acts first.
class Transformation {
public:
	// Constructors
	Transformation(); // Identity
	Transformation(std::initializer_list<TransformUnit> units);

	// Append a unit. The cache becomes unit.matrix() * cache.
	Transformation &add(const TransformUnit &unit);

	const std::vector<TransformUnit> &units() const;
	const Mat4 &matrix() const;

	// Returns false if the composed matrix is singular.
	bool try_inverse(Mat4 &inverse) const;

	// Throws NonInvertibleMatrix if the composed matrix is singular.
	Mat4 inverse() const;

	Vec4 apply(const Vec4 &v) const;
	Ray apply(const Ray &ray) const;

private:
	std::vector<TransformUnit> units_;
	Mat4 matrix_;
};

}

#endif
