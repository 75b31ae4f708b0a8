#ifndef LRE_INCLUDE_LIGHT_POINT_LIGHT_H
#define LRE_INCLUDE_LIGHT_POINT_LIGHT_H

#include <basic/color.h>
#include <basic/vec4.h>
#include <material/material.h>
#include <object/object.h>

namespace lre {

// Point light source
class PointLight {
public:
	// Constructors
	PointLight(); // White light at the origin
	PointLight(const Point4 &position, const Color &intensity);

	const Point4 &position() const;
	const Color &intensity() const;

	// Phong reflection model at a surface point with the material color as surface color.
	// A shadowed point only gets the ambient term. The result is not clamped.
	Color shade(const Material &material, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const;

	// Same as above with the object's surface color (its pattern, if any) at the point.
	Color shade(const Object &object, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const;

private:
	Color phong(const Color &surface, const Material &material, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const;

	Point4 position_;
	Color intensity_;
};

}

#endif
