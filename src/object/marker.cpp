#include <basic/error.h>
#include <cmath>
#include <object/marker.h>
#include <string>

namespace lre {

Marker::Marker() : position_(point(0.0, 0.0, 0.0)) {
}

Marker::Marker(const Point4 &position, const Color &color) : position_(position) {
	material().color = color;
}

TValues Marker::local_intersect(const Ray &object_ray) const {
	return {};
}

Point4 Marker::world_position() const {
	return transform().apply(position_);
}

void Marker::draw(Canvas &canvas) const {
	const Point4 p = world_position();
	const double x = std::round(p.x());
	const double y = std::round(p.y());
	if (x < 0.0 || y < 0.0 || x >= canvas.width() || y >= canvas.height()) {
		throw CanvasOutOfBounds("Marker at (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the canvas");
	}

	canvas.write(static_cast<int>(x), static_cast<int>(y), material().color);
}

}
