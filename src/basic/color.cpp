#include <basic/color.h>
#include <basic/error.h>
#include <basic/math.h>
#include <cmath>

namespace lre {

Color::Color()
	: c_ { 0, 0, 0 } {
}

Color::Color(double r, double g, double b)
	: c_ { r, g, b } {
}

Color Color::black() {
	return Color(0.0, 0.0, 0.0);
}

Color Color::white() {
	return Color(1.0, 1.0, 1.0);
}

double Color::r() const {
	return c_[0];
}

double Color::g() const {
	return c_[1];
}

double Color::b() const {
	return c_[2];
}

Color &Color::operator+=(const Color &c) {
	for (int i = 0; i < 3; c_[i] += c.c_[i], ++i)
		;
	return *this;
}

Color &Color::operator-=(const Color &c) {
	for (int i = 0; i < 3; c_[i] -= c.c_[i], ++i)
		;
	return *this;
}

Color &Color::operator*=(double t) {
	for (int i = 0; i < 3; c_[i] *= t, ++i)
		;
	return *this;
}

int Color::to_channel(double value) {
	if (value > 1.0) {
		return 255;
	}
	if (value < 0.0) {
		return 0;
	}
	return static_cast<int>(std::round(value * 255.0));
}

std::string Color::to_ppm() const {
	return std::to_string(to_channel(c_[0])) + " " + std::to_string(to_channel(c_[1])) + " " + std::to_string(to_channel(c_[2]));
}

Color operator+(const Color &u, const Color &v) {
	return Color(u.c_[0] + v.c_[0], u.c_[1] + v.c_[1], u.c_[2] + v.c_[2]);
}

Color operator-(const Color &u, const Color &v) {
	return Color(u.c_[0] - v.c_[0], u.c_[1] - v.c_[1], u.c_[2] - v.c_[2]);
}

Color operator*(const Color &u, const Color &v) {
	return Color(u.c_[0] * v.c_[0], u.c_[1] * v.c_[1], u.c_[2] * v.c_[2]);
}

Color operator*(double t, const Color &c) {
	return Color(t * c.c_[0], t * c.c_[1], t * c.c_[2]);
}

Color operator*(const Color &c, double t) {
	return t * c;
}

Color operator/(const Color &c, double t) {
	if (std::fabs(t) < EPSILON) {
		throw DivisionByZero("Color divided by a near-zero scalar");
	}
	return (1.0 / t) * c;
}

bool operator==(const Color &u, const Color &v) {
	return feq(u.r(), v.r()) && feq(u.g(), v.g()) && feq(u.b(), v.b());
}

bool operator!=(const Color &u, const Color &v) {
	return !(u == v);
}

std::ostream &operator<<(std::ostream &os, const Color &c) {
	return os << "Color(" << c.r() << ", " << c.g() << ", " << c.b() << ")";
}

}
