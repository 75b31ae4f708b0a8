#include <basic/error.h>
#include <object/object.h>

namespace lre {

Object::~Object() = default;

const Transformation &Object::transform() const {
	return transform_;
}

void Object::set_transform(const Transformation &transform) {
	transform_ = transform;
}

void Object::add_transform(const TransformUnit &unit) {
	transform_.add(unit);
}

const Material &Object::material() const {
	return material_;
}

Material &Object::material() {
	return material_;
}

void Object::set_material(const Material &material) {
	material_ = material;
}

TValues Object::intersect(const Ray &world_ray) const {
	const Mat4 inverse = transform_.inverse();
	return local_intersect(inverse * world_ray);
}

Vec4 Object::normal(const Point4 &world_point) const {
	const Mat4 inverse = transform_.inverse();

	const Point4 object_point = inverse * world_point;
	const Vec4 object_normal = local_normal(object_point);

	// Translation leaks into w through the transpose
	Vec4 world_normal = inverse.transpose() * object_normal;
	world_normal[3] = 0.0;

	return world_normal.normalize();
}

Color Object::color_at(const Point4 &world_point) const {
	if (!material_.pattern) {
		return material_.color;
	}
	return material_.pattern->pattern_at_object(*this, world_point);
}

TValues Object::local_intersect(const Ray &object_ray) const {
	throw UnsupportedOperation("This object does not implement local_intersect");
}

Vec4 Object::local_normal(const Point4 &object_point) const {
	throw UnsupportedOperation("This object does not implement local_normal");
}

}
