#include <cmath>
#include <material/gradient.h>

namespace lre {

Gradient::Gradient() : Pattern(Color::white(), Color::black()) {
}

Gradient::Gradient(const Color &a, const Color &b) : Pattern(a, b) {
}

Color Gradient::pattern_at(const Point4 &pattern_point) const {
	const double x = pattern_point.x();
	const double fraction = x - std::floor(x);
	return a() + (b() - a()) * fraction;
}

}
