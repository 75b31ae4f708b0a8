#include <cmath>
#include <stdexcept>
#include <transform/transform_unit.h>

namespace lre {

TransformUnit::TransformUnit() : TransformUnit(Kind::Identity, 0, 0, 0, 0, 0, 0) {
}

TransformUnit::TransformUnit(Kind kind, double p0, double p1, double p2, double p3, double p4, double p5)
	: kind_(kind), p_ { p0, p1, p2, p3, p4, p5 } {
}

TransformUnit TransformUnit::identity() {
	return TransformUnit();
}

TransformUnit TransformUnit::translate(double dx, double dy, double dz) {
	return TransformUnit(Kind::Translate, dx, dy, dz, 0, 0, 0);
}

TransformUnit TransformUnit::scale(double fx, double fy, double fz) {
	return TransformUnit(Kind::Scale, fx, fy, fz, 0, 0, 0);
}

TransformUnit TransformUnit::rotate_x(double angle) {
	return TransformUnit(Kind::RotateX, angle, 0, 0, 0, 0, 0);
}

TransformUnit TransformUnit::rotate_y(double angle) {
	return TransformUnit(Kind::RotateY, angle, 0, 0, 0, 0, 0);
}

TransformUnit TransformUnit::rotate_z(double angle) {
	return TransformUnit(Kind::RotateZ, angle, 0, 0, 0, 0, 0);
}

TransformUnit TransformUnit::shear(double xy, double xz, double yx, double yz, double zx, double zy) {
	return TransformUnit(Kind::Shear, xy, xz, yx, yz, zx, zy);
}

TransformUnit::Kind TransformUnit::kind() const {
	return kind_;
}

double TransformUnit::param(int i) const {
	if (i < 0 || i >= 6) {
		throw std::out_of_range("Transform unit parameter index out of range");
	}
	return p_[i];
}

Mat4 TransformUnit::matrix() const {
	switch (kind_) {
	case Kind::Translate:
		return Mat4(1, 0, 0, p_[0],
			0, 1, 0, p_[1],
			0, 0, 1, p_[2],
			0, 0, 0, 1);
	case Kind::Scale:
		return Mat4(p_[0], 0, 0, 0,
			0, p_[1], 0, 0,
			0, 0, p_[2], 0,
			0, 0, 0, 1);
	case Kind::RotateX: {
		const double c = std::cos(p_[0]), s = std::sin(p_[0]);
		return Mat4(1, 0, 0, 0,
			0, c, -s, 0,
			0, s, c, 0,
			0, 0, 0, 1);
	}
	case Kind::RotateY: {
		const double c = std::cos(p_[0]), s = std::sin(p_[0]);
		return Mat4(c, 0, s, 0,
			0, 1, 0, 0,
			-s, 0, c, 0,
			0, 0, 0, 1);
	}
	case Kind::RotateZ: {
		const double c = std::cos(p_[0]), s = std::sin(p_[0]);
		return Mat4(c, -s, 0, 0,
			s, c, 0, 0,
			0, 0, 1, 0,
			0, 0, 0, 1);
	}
	case Kind::Shear:
		return Mat4(1, p_[0], p_[1], 0,
			p_[2], 1, p_[3], 0,
			p_[4], p_[5], 1, 0,
			0, 0, 0, 1);
	case Kind::Identity:
	default:
		return Mat4::identity();
	}
}

}
