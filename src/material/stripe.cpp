#include <cmath>
#include <material/stripe.h>

namespace lre {

Stripe::Stripe() : Pattern(Color::white(), Color::black()) {
}

Stripe::Stripe(const Color &a, const Color &b) : Pattern(a, b) {
}

Color Stripe::pattern_at(const Point4 &pattern_point) const {
	const double band = std::floor(pattern_point.x());
	return std::fmod(band, 2.0) == 0.0 ? a() : b();
}

}
