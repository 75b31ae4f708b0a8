#include <basic/error.h>
#include <basic/math.h>
#include <basic/matrix.h>
#include <cmath>
#include <utility>

namespace lre {

Mat4::Mat4()
	: m_ {} {
}

Mat4::Mat4(double a11, double a12, double a13, double a14,
	double a21, double a22, double a23, double a24,
	double a31, double a32, double a33, double a34,
	double a41, double a42, double a43, double a44)
	: m_ { { a11, a12, a13, a14 }, { a21, a22, a23, a24 }, { a31, a32, a33, a34 }, { a41, a42, a43, a44 } } {
}

Mat4 Mat4::identity() {
	Mat4 res;
	for (int i = 0; i < 4; res.m_[i][i] = 1.0, ++i)
		;
	return res;
}

double Mat4::operator()(int row, int col) const {
	return m_[row][col];
}

double &Mat4::operator()(int row, int col) {
	return m_[row][col];
}

Mat4 Mat4::transpose() const {
	Mat4 res;
	for (int r = 0; r < 4; ++r) {
		for (int c = 0; c < 4; ++c) {
			res.m_[c][r] = m_[r][c];
		}
	}
	return res;
}

bool Mat4::try_inverse(Mat4 &inverse) const {
	// Augmented matrix [M|I]
	double M[4][8];
	for (int r = 0; r < 4; ++r) {
		for (int c = 0; c < 4; ++c) {
			M[r][c] = m_[r][c];
			M[r][c + 4] = (r == c) ? 1.0 : 0.0;
		}
	}

	for (int col = 0; col < 4; ++col) {
		// Find pivot
		int pivot = col;
		double best = std::fabs(M[col][col]);
		for (int r = col + 1; r < 4; ++r) {
			double v = std::fabs(M[r][col]);
			if (v > best) {
				best = v;
				pivot = r;
			}
		}
		if (!(best >= GEOMETRY_EPSILON)) {
			return false;
		}

		// Swap rows
		if (pivot != col) {
			for (int c = 0; c < 8; std::swap(M[col][c], M[pivot][c]), ++c)
				;
		}

		// Normalize pivot row
		double div = M[col][col];
		for (int c = 0; c < 8; M[col][c] /= div, ++c)
			;

		// Eliminate other rows
		for (int r = 0; r < 4; ++r) {
			if (r == col) {
				continue;
			}
			double factor = M[r][col];
			if (factor == 0.0) {
				continue;
			}
			for (int c = 0; c < 8; M[r][c] -= factor * M[col][c], ++c)
				;
		}
	}

	for (int r = 0; r < 4; ++r) {
		for (int c = 0; c < 4; ++c) {
			inverse.m_[r][c] = M[r][c + 4];
		}
	}
	return true;
}

Mat4 Mat4::inverse() const {
	Mat4 res;
	if (!try_inverse(res)) {
		throw NonInvertibleMatrix("Mat4 is singular and cannot be inverted");
	}
	return res;
}

Mat4 operator*(const Mat4 &a, const Mat4 &b) {
	Mat4 res;
	for (int r = 0; r < 4; ++r) {
		for (int c = 0; c < 4; ++c) {
			double sum = 0.0;
			for (int k = 0; k < 4; sum += a.m_[r][k] * b.m_[k][c], ++k)
				;
			res.m_[r][c] = sum;
		}
	}
	return res;
}

Vec4 operator*(const Mat4 &m, const Vec4 &v) {
	double out[4];
	for (int r = 0; r < 4; ++r) {
		out[r] = m.m_[r][0] * v[0] + m.m_[r][1] * v[1] + m.m_[r][2] * v[2] + m.m_[r][3] * v[3];
	}
	return Vec4(out[0], out[1], out[2], out[3]);
}

bool operator==(const Mat4 &a, const Mat4 &b) {
	double sum = 0.0;
	for (int r = 0; r < 4; ++r) {
		for (int c = 0; c < 4; ++c) {
			double d = a(r, c) - b(r, c);
			sum += d * d;
		}
	}
	return std::sqrt(sum) < EPSILON;
}

bool operator!=(const Mat4 &a, const Mat4 &b) {
	return !(a == b);
}

std::ostream &operator<<(std::ostream &os, const Mat4 &m) {
	os << "[";
	for (int r = 0; r < 4; ++r) {
		os << (r == 0 ? "[" : " [");
		for (int c = 0; c < 4; ++c) {
			os << m(r, c) << (c == 3 ? "]" : ", ");
		}
	}
	return os << "]";
}

}
