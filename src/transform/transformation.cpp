#include <basic/error.h>
#include <transform/transformation.h>

namespace lre {

Transformation::Transformation() : matrix_(Mat4::identity()) {
}

Transformation::Transformation(std::initializer_list<TransformUnit> units) : matrix_(Mat4::identity()) {
	for (const TransformUnit &unit : units) {
		add(unit);
	}
}

Transformation &Transformation::add(const TransformUnit &unit) {
	units_.push_back(unit);
	matrix_ = unit.matrix() * matrix_;
	return *this;
}

const std::vector<TransformUnit> &Transformation::units() const {
	return units_;
}

const Mat4 &Transformation::matrix() const {
	return matrix_;
}

bool Transformation::try_inverse(Mat4 &inverse) const {
	return matrix_.try_inverse(inverse);
}

Mat4 Transformation::inverse() const {
	Mat4 res;
	if (!matrix_.try_inverse(res)) {
		throw NonInvertibleMatrix("Transformation of " + std::to_string(units_.size()) + " unit(s) is not invertible");
	}
	return res;
}

Vec4 Transformation::apply(const Vec4 &v) const {
	return matrix_ * v;
}

Ray Transformation::apply(const Ray &ray) const {
	return ray.transformed(matrix_);
}

}
