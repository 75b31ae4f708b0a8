#ifndef LRE_INCLUDE_MATERIAL_STRIPE_H
#define LRE_INCLUDE_MATERIAL_STRIPE_H

#include <material/pattern.h>

namespace lre {

// Stripe pattern class, derived from class Pattern. Alternates along x: a when floor(x) is even, else b.
class Stripe : public Pattern {
public:
	// Constructor to initialize a Stripe object. Defaults to white and black.
	Stripe();
	Stripe(const Color &a, const Color &b);

	// Destructors
	~Stripe() override = default;

	Color pattern_at(const Point4 &pattern_point) const override;
};

}

#endif
