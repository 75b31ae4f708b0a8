#ifndef LRE_INCLUDE_MATERIAL_GRADIENT_H
#define LRE_INCLUDE_MATERIAL_GRADIENT_H

#include <material/pattern.h>

namespace lre {

// Gradient pattern class, derived from class Pattern. Blends linearly from a to b over every unit of x.
class Gradient : public Pattern {
public:
	// Constructor to initialize a Gradient object. Defaults to white and black.
	Gradient();
	Gradient(const Color &a, const Color &b);

	// Destructors
	~Gradient() override = default;

	Color pattern_at(const Point4 &pattern_point) const override;
};

}

#endif
