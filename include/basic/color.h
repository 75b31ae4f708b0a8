#ifndef LRE_INCLUDE_BASIC_COLOR_H
#define LRE_INCLUDE_BASIC_COLOR_H

#include <ostream>
#include <string>

namespace lre {

// RGB color with an unbounded real range. Clamping only happens on serialization.
class Color {
private:
	double c_[3]; // r, g, b value

public:
	// Constructors
	Color();
	Color(double r, double g, double b);

	static Color black();
	static Color white();

	// Component access
	double r() const;
	double g() const;
	double b() const;

	// Compound assignment operations
	Color &operator+=(const Color &c);
	Color &operator-=(const Color &c);
	Color &operator*=(double t);

	// Channel conversion to [0, 255]: above 1.0 gives 255, below 0.0 gives 0, otherwise round(v * 255)
	static int to_channel(double value);

	// "r g b" with every channel converted by to_channel
	std::string to_ppm() const;

	friend Color operator+(const Color &u, const Color &v);
	friend Color operator-(const Color &u, const Color &v);
	friend Color operator*(const Color &u, const Color &v); // Schur product
	friend Color operator*(double t, const Color &c);
	friend Color operator*(const Color &c, double t);
	friend Color operator/(const Color &c, double t);
};

Color operator+(const Color &u, const Color &v);
Color operator-(const Color &u, const Color &v);
Color operator*(const Color &u, const Color &v);
Color operator*(double t, const Color &c);
Color operator*(const Color &c, double t);
Color operator/(const Color &c, double t); // Throws DivisionByZero if |t| < EPSILON

// Per channel equality within EPSILON
bool operator==(const Color &u, const Color &v);
bool operator!=(const Color &u, const Color &v);

std::ostream &operator<<(std::ostream &os, const Color &c);

}

#endif
