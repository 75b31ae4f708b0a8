#ifndef LRE_INCLUDE_MATERIAL_PATTERN_H
#define LRE_INCLUDE_MATERIAL_PATTERN_H

#include <basic/color.h>
#include <basic/vec4.h>
#include <transform/transformation.h>

namespace lre {

// The declaration of Object to avoid circular dependency(forward declaration), please see object.h for the detailed definition.
class Object;

// Pattern base class: a two-color function of a point in pattern space.
class Pattern {
protected:
	// Declare the constructor in protected section.
	Pattern(const Color &a, const Color &b);

public:
	// Constructors
	Pattern(const Pattern &) = delete; // Delete the copy constructor
	Pattern &operator=(const Pattern &) = delete;

	// Destructor
	virtual ~Pattern();

	void set_colors(const Color &a, const Color &b);
	const Color &a() const;
	const Color &b() const;

	void set_transform(const Transformation &transform);
	void add_transform(const TransformUnit &unit);
	const Transformation &transform() const;

	// Color at a point given in pattern space.
	virtual Color pattern_at(const Point4 &pattern_point) const = 0;

	// Color at a world point on the object: world -> object space -> pattern space.
	// Throws NonInvertibleMatrix if either transformation is singular.
	Color pattern_at_object(const Object &object, const Point4 &world_point) const;

private:
	Color a_, b_;
	Transformation transform_;
};

}

#endif
