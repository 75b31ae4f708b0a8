#include <basic/error.h>
#include <basic/math.h>
#include <basic/vec4.h>

namespace lre {

// Default constructor - creates zero vector
Vec4::Vec4()
	: e_ { 0, 0, 0, 0 } {
}

// Parameterized constructor
Vec4::Vec4(double e0, double e1, double e2, double e3)
	: e_ { e0, e1, e2, e3 } {
}

// Copy constructor
Vec4::Vec4(const Vec4 &other)
	: e_ { other.e_[0], other.e_[1], other.e_[2], other.e_[3] } {
}

double Vec4::x() const {
	return e_[0];
}

double Vec4::y() const {
	return e_[1];
}

double Vec4::z() const {
	return e_[2];
}

double Vec4::w() const {
	return e_[3];
}

bool Vec4::is_point() const {
	return feq(e_[3], 1.0);
}

bool Vec4::is_vector() const {
	return feq(e_[3], 0.0);
}

// Negation operator
Vec4 Vec4::operator-() const {
	return Vec4(-e_[0], -e_[1], -e_[2], -e_[3]);
}

// Const index access
double Vec4::operator[](int i) const {
	return e_[i];
}

// Non-const index access
double &Vec4::operator[](int i) {
	return e_[i];
}

// Assignment operator
Vec4 &Vec4::operator=(const Vec4 &other) {
	if (this != &other) {
		for (int i = 0; i < 4; e_[i] = other.e_[i], ++i)
			;
	}
	return *this;
}

Vec4 &Vec4::operator+=(const Vec4 &v) {
	for (int i = 0; i < 4; e_[i] += v.e_[i], ++i)
		;
	return *this;
}

Vec4 &Vec4::operator-=(const Vec4 &v) {
	for (int i = 0; i < 4; e_[i] -= v.e_[i], ++i)
		;
	return *this;
}

Vec4 &Vec4::operator*=(double t) {
	for (int i = 0; i < 4; e_[i] *= t, ++i)
		;
	return *this;
}

Vec4 &Vec4::operator/=(double t) {
	if (std::fabs(t) < EPSILON) {
		throw DivisionByZero("Vec4 divided by a near-zero scalar");
	}
	return *this *= (1.0 / t);
}

double Vec4::magnitude() const {
	return std::sqrt(magnitude_squared());
}

double Vec4::magnitude_squared() const {
	return dot(*this);
}

Vec4 &Vec4::normalize() {
	double len = magnitude();
	if (len < EPSILON) {
		throw DivisionByZero("Cannot normalize a zero-length Vec4");
	}
	return *this *= (1.0 / len);
}

Vec4 Vec4::normalized() const {
	Vec4 res(*this);
	return res.normalize();
}

double Vec4::dot(const Vec4 &v) const {
	return e_[0] * v.e_[0] + e_[1] * v.e_[1] + e_[2] * v.e_[2] + e_[3] * v.e_[3];
}

Vec4 Vec4::cross(const Vec4 &v) const {
	return Vec4(e_[1] * v.e_[2] - e_[2] * v.e_[1], e_[2] * v.e_[0] - e_[0] * v.e_[2],
		e_[0] * v.e_[1] - e_[1] * v.e_[0], 0.0);
}

bool Vec4::near_zero() const {
	return magnitude() < EPSILON;
}

Vec4 operator+(const Vec4 &u, const Vec4 &v) {
	return Vec4(u.e_[0] + v.e_[0], u.e_[1] + v.e_[1], u.e_[2] + v.e_[2], u.e_[3] + v.e_[3]);
}

Vec4 operator-(const Vec4 &u, const Vec4 &v) {
	return Vec4(u.e_[0] - v.e_[0], u.e_[1] - v.e_[1], u.e_[2] - v.e_[2], u.e_[3] - v.e_[3]);
}

// Scalar multiplication (scalar first)
Vec4 operator*(double t, const Vec4 &v) {
	return Vec4(t * v.e_[0], t * v.e_[1], t * v.e_[2], t * v.e_[3]);
}

// Scalar multiplication (scalar second)
Vec4 operator*(const Vec4 &v, double t) {
	return t * v;
}

Vec4 operator/(const Vec4 &v, double t) {
	Vec4 res(v);
	return res /= t;
}

bool operator==(const Vec4 &u, const Vec4 &v) {
	return (u - v).magnitude() < EPSILON;
}

bool operator!=(const Vec4 &u, const Vec4 &v) {
	return !(u == v);
}

std::ostream &operator<<(std::ostream &os, const Vec4 &v) {
	return os << "(" << v.x() << ", " << v.y() << ", " << v.z() << ", " << v.w() << ")";
}

Vec4 point(double x, double y, double z) {
	return Vec4(x, y, z, 1.0);
}

Vec4 vector(double x, double y, double z) {
	return Vec4(x, y, z, 0.0);
}

double dot(const Vec4 &a, const Vec4 &b) {
	return a.dot(b);
}

Vec4 cross(const Vec4 &a, const Vec4 &b) {
	return a.cross(b);
}

// Reflects v across the normal n
Vec4 reflect(const Vec4 &v, const Vec4 &n) {
	return v - 2 * dot(n, v) * n;
}

}
