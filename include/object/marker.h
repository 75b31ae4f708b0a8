#ifndef LRE_INCLUDE_OBJECT_MARKER_H
#define LRE_INCLUDE_OBJECT_MARKER_H

#include <basic/color.h>
#include <basic/ray.h>
#include <basic/vec4.h>
#include <canvas.h>
#include <object/object.h>

namespace lre {

// Point marker, derived from class Object. It has no extent, so rays never hit it and
// it has no normal; it is drawn straight onto a canvas instead.
class Marker : public Object {
public:
	Marker();
	Marker(const Point4 &position, const Color &color);

	// Destructors
	~Marker() override = default;

	TValues local_intersect(const Ray &object_ray) const override;

	// Transformed position
	Point4 world_position() const;

	// Write the material color at the rounded (x, y) of the transformed position.
	// Throws CanvasOutOfBounds when the position falls outside the canvas.
	void draw(Canvas &canvas) const;

private:
	Point4 position_;
};

}

#endif
