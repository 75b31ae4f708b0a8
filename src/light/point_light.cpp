#include <cmath>
#include <light/point_light.h>

namespace lre {

PointLight::PointLight() : position_(point(0.0, 0.0, 0.0)), intensity_(Color::white()) {
}

PointLight::PointLight(const Point4 &position, const Color &intensity) : position_(position), intensity_(intensity) {
}

const Point4 &PointLight::position() const {
	return position_;
}

const Color &PointLight::intensity() const {
	return intensity_;
}

Color PointLight::shade(const Material &material, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const {
	return phong(material.color, material, point, eye, normal, in_shadow);
}

Color PointLight::shade(const Object &object, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const {
	return phong(object.color_at(point), object.material(), point, eye, normal, in_shadow);
}

Color PointLight::phong(const Color &surface, const Material &material, const Point4 &point, const Vec4 &eye, const Vec4 &normal, bool in_shadow) const {
	// Combine the surface color with the light's intensity
	const Color effective = intensity_ * surface;

	// Direction to the light source
	const Vec4 light = (position_ - point).normalize();

	const Color ambient = effective * material.ambient;
	if (in_shadow) {
		return ambient;
	}

	Color diffuse = Color::black();
	Color specular = Color::black();

	// Cosine of the angle between the light vector and the normal. Negative means
	// the light is on the other side of the surface.
	const double light_dot_normal = dot(light, normal);
	if (light_dot_normal >= 0.0) {
		diffuse = effective * material.diffuse * light_dot_normal;

		// Cosine of the angle between the reflected light and the eye. Negative means
		// the light reflects away from the eye.
		const Vec4 reflected = reflect(-light, normal);
		const double reflect_dot_eye = dot(reflected, eye);
		if (reflect_dot_eye > 0.0) {
			const double factor = std::pow(reflect_dot_eye, material.shininess);
			specular = intensity_ * material.specular * factor;
		}
	}

	return ambient + diffuse + specular;
}

}
