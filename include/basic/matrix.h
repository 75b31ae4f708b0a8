#ifndef LRE_INCLUDE_BASIC_MATRIX_H
#define LRE_INCLUDE_BASIC_MATRIX_H

#include <basic/vec4.h>
#include <ostream>

namespace lre {

// Row-major 4x4 matrix acting on column Vec4s.
class Mat4 {
private:
	double m_[4][4];

public:
	// Constructors
	Mat4(); // Zero matrix
	Mat4(double a11, double a12, double a13, double a14,
		double a21, double a22, double a23, double a24,
		double a31, double a32, double a33, double a34,
		double a41, double a42, double a43, double a44);

	static Mat4 identity();

	// Element access by (row, col)
	double operator()(int row, int col) const;
	double &operator()(int row, int col);

	Mat4 transpose() const;

	// Inverse by Gauss-Jordan elimination. Returns false if the matrix is singular.
	bool try_inverse(Mat4 &inverse) const;

	// Throws NonInvertibleMatrix if the matrix is singular.
	Mat4 inverse() const;

	friend Mat4 operator*(const Mat4 &a, const Mat4 &b);
	friend Vec4 operator*(const Mat4 &m, const Vec4 &v);
};

Mat4 operator*(const Mat4 &a, const Mat4 &b);
Vec4 operator*(const Mat4 &m, const Vec4 &v);

// Epsilon equality on the Frobenius norm of the difference
bool operator==(const Mat4 &a, const Mat4 &b);
bool operator!=(const Mat4 &a, const Mat4 &b);

std::ostream &operator<<(std::ostream &os, const Mat4 &m);

}

#endif
