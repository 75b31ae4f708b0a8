#ifndef LRE_INCLUDE_BASIC_VEC4_H
#define LRE_INCLUDE_BASIC_VEC4_H

#include <cmath>
#include <ostream>

namespace lre {

// Homogeneous 4-component tuple: w = 1 is a point, w = 0 is a direction.
class Vec4 {
private:
	double e_[4]; // x, y, z, w value

public:
	// Constructors
	Vec4();
	Vec4(double e0, double e1, double e2, double e3);

	// Copy constructor
	Vec4(const Vec4 &other);

	// Destructor
	~Vec4() = default;

	// Component access
	double x() const;
	double y() const;
	double z() const;
	double w() const;

	bool is_point() const;
	bool is_vector() const;

	// Vector operations
	Vec4 operator-() const; // Negation
	double operator[](int i) const;
	double &operator[](int i);

	// Vector assignment
	Vec4 &operator=(const Vec4 &other);

	// Compound assignment operations
	Vec4 &operator+=(const Vec4 &v);
	Vec4 &operator-=(const Vec4 &v);
	Vec4 &operator*=(double t);
	Vec4 &operator/=(double t); // Throws DivisionByZero if |t| < EPSILON

	// Vector length operations
	double magnitude() const;
	double magnitude_squared() const;

	// Normalization - throws DivisionByZero if the length is near zero
	Vec4 &normalize();
	Vec4 normalized() const;

	// Dot product over all four components
	double dot(const Vec4 &v) const;

	// Cross product of the xyz parts, the result is a vector
	Vec4 cross(const Vec4 &v) const;

	// Check if vector is near zero
	bool near_zero() const;

	// Friend function declarations
	friend Vec4 operator+(const Vec4 &u, const Vec4 &v);
	friend Vec4 operator-(const Vec4 &u, const Vec4 &v);
	friend Vec4 operator*(double t, const Vec4 &v);
	friend Vec4 operator*(const Vec4 &v, double t);
	friend Vec4 operator/(const Vec4 &v, double t);
};

// Vector operation friend function declarations
Vec4 operator+(const Vec4 &u, const Vec4 &v);
Vec4 operator-(const Vec4 &u, const Vec4 &v);
Vec4 operator*(double t, const Vec4 &v);
Vec4 operator*(const Vec4 &v, double t);
Vec4 operator/(const Vec4 &v, double t); // Throws DivisionByZero if |t| < EPSILON

// Epsilon equality: the norm of the difference is below EPSILON
bool operator==(const Vec4 &u, const Vec4 &v);
bool operator!=(const Vec4 &u, const Vec4 &v);

std::ostream &operator<<(std::ostream &os, const Vec4 &v);

// Utility functions
Vec4 point(double x, double y, double z);
Vec4 vector(double x, double y, double z);
double dot(const Vec4 &a, const Vec4 &b);
Vec4 cross(const Vec4 &a, const Vec4 &b);
Vec4 reflect(const Vec4 &v, const Vec4 &n);

// Some other type based on Vec4 class
using Point4 = Vec4;

}

#endif
