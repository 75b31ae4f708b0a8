#include <material/pattern.h>
#include <object/object.h>

namespace lre {

Pattern::Pattern(const Color &a, const Color &b) : a_(a), b_(b) {
}

Pattern::~Pattern() = default;

void Pattern::set_colors(const Color &a, const Color &b) {
	a_ = a;
	b_ = b;
}

const Color &Pattern::a() const {
	return a_;
}

const Color &Pattern::b() const {
	return b_;
}

void Pattern::set_transform(const Transformation &transform) {
	transform_ = transform;
}

void Pattern::add_transform(const TransformUnit &unit) {
	transform_.add(unit);
}

const Transformation &Pattern::transform() const {
	return transform_;
}

Color Pattern::pattern_at_object(const Object &object, const Point4 &world_point) const {
	const Point4 object_point = object.transform().inverse() * world_point;
	const Point4 pattern_point = transform_.inverse() * object_point;
	return pattern_at(pattern_point);
}

}
