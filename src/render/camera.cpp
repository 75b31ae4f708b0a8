#include <basic/error.h>
#include <cmath>
#include <render/camera.h>
#include <stdexcept>
#include <transform/transform_unit.h>

namespace lre {

Mat4 view_transform(const Point4 &from, const Point4 &to, const Vec4 &up) {
	const Vec4 forward = (to - from).normalize();
	const Vec4 left = cross(forward, up.normalized());
	if (left.near_zero()) {
		throw DivisionByZero("View up vector is parallel to the view direction");
	}
	const Vec4 true_up = cross(left, forward);

	const Mat4 orientation(left.x(), left.y(), left.z(), 0.0,
		true_up.x(), true_up.y(), true_up.z(), 0.0,
		-forward.x(), -forward.y(), -forward.z(), 0.0,
		0.0, 0.0, 0.0, 1.0);

	return orientation * TransformUnit::translate(-from.x(), -from.y(), -from.z()).matrix();
}

Camera::Camera(int hsize, int vsize, double field_of_view)
	: hsize_(hsize), vsize_(vsize), field_of_view_(field_of_view), view_(Mat4::identity()) {
	if (hsize <= 0 || vsize <= 0) {
		throw std::invalid_argument("Camera pixel counts must be positive");
	}

	const double half_view = std::tan(field_of_view / 2.0);
	const double aspect = static_cast<double>(hsize) / static_cast<double>(vsize);
	if (aspect >= 1.0) {
		half_width_ = half_view;
		half_height_ = half_view / aspect;
	} else {
		half_width_ = half_view * aspect;
		half_height_ = half_view;
	}
	pixel_size_ = half_width_ * 2.0 / static_cast<double>(hsize);
}

int Camera::hsize() const {
	return hsize_;
}

int Camera::vsize() const {
	return vsize_;
}

double Camera::field_of_view() const {
	return field_of_view_;
}

double Camera::pixel_size() const {
	return pixel_size_;
}

double Camera::half_width() const {
	return half_width_;
}

double Camera::half_height() const {
	return half_height_;
}

const Mat4 &Camera::view() const {
	return view_;
}

void Camera::set_transform(const Mat4 &view) {
	view_ = view;
}

void Camera::set_view(const Point4 &from, const Point4 &to, const Vec4 &up) {
	view_ = view_transform(from, to, up);
}

Ray Camera::ray_for_pixel(int x, int y) const {
	// Offset from the edge of the canvas to the pixel's center
	const double x_offset = (x + 0.5) * pixel_size_;
	const double y_offset = (y + 0.5) * pixel_size_;

	// The camera looks toward -z, so +x is to the left
	const double world_x = half_width_ - x_offset;
	const double world_y = half_height_ - y_offset;

	const Mat4 inverse = view_.inverse();
	const Point4 pixel = inverse * point(world_x, world_y, -1.0);
	const Point4 origin = inverse * point(0.0, 0.0, 0.0);
	const Vec4 direction = (pixel - origin).normalize();

	return Ray(origin, direction);
}

}
