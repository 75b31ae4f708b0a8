#ifndef LRE_INCLUDE_RENDER_CAMERA_H
#define LRE_INCLUDE_RENDER_CAMERA_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <basic/vec4.h>

namespace lre {

// Orientation built from {left, true_up, -forward} rows, composed with a translation by -from.
// Throws DivisionByZero if from == to or up is parallel to the view direction.
Mat4 view_transform(const Point4 &from, const Point4 &to, const Vec4 &up);

// Pinhole camera looking down -z in camera space, with the canvas one unit in front of the eye.
class Camera {
public:
	// Constructors
	Camera(int hsize, int vsize, double field_of_view);

	int hsize() const;
	int vsize() const;
	double field_of_view() const;
	double pixel_size() const;
	double half_width() const;
	double half_height() const;

	// World -> camera space matrix, identity by default
	const Mat4 &view() const;
	void set_transform(const Mat4 &view);
	void set_view(const Point4 &from, const Point4 &to, const Vec4 &up);

	// Ray from the eye through the center of pixel (x, y).
	// Throws NonInvertibleMatrix if the view transform is singular.
	Ray ray_for_pixel(int x, int y) const;

private:
	int hsize_, vsize_;
	double field_of_view_;
	double pixel_size_;
	double half_width_, half_height_;
	Mat4 view_;
};

}

#endif
