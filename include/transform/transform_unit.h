#ifndef LRE_INCLUDE_TRANSFORM_TRANSFORM_UNIT_H
#define LRE_INCLUDE_TRANSFORM_TRANSFORM_UNIT_H

#include <basic/matrix.h>

namespace lre {

// One primitive affine operation. Parameters are interpreted according to the kind:
//   Translate(dx, dy, dz), Scale(fx, fy, fz), RotateX/Y/Z(angle in radians),
//   Shear(xy, xz, yx, yz, zx, zy), Identity().
class TransformUnit {
public:
	enum class Kind {
		Identity,
		Translate,
		Scale,
		RotateX,
		RotateY,
		RotateZ,
		Shear
	};

	// Constructors
	TransformUnit(); // Identity

	static TransformUnit identity();
	static TransformUnit translate(double dx, double dy, double dz);
	static TransformUnit scale(double fx, double fy, double fz);
	static TransformUnit rotate_x(double angle);
	static TransformUnit rotate_y(double angle);
	static TransformUnit rotate_z(double angle);
	static TransformUnit shear(double xy, double xz, double yx, double yz, double zx, double zy);

	Kind kind() const;
	// Raw parameter i in [0, 6), throws std::out_of_range otherwise
	double param(int i) const;

	// The matrix this unit stands for
	Mat4 matrix() const;

private:
	TransformUnit(Kind kind, double p0, double p1, double p2, double p3, double p4, double p5);

	Kind kind_;
	double p_[6];
};

}

#endif
