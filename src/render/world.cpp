#include <basic/error.h>
#include <basic/math.h>
#include <render/world.h>
#include <string>

namespace lre {

ObjectId World::add_object(std::unique_ptr<Object> object) {
	return objects_.add(std::move(object));
}

void World::add_light(const PointLight &light) {
	lights_.push_back(light);
}

ObjectSet &World::objects() {
	return objects_;
}

const ObjectSet &World::objects() const {
	return objects_;
}

const std::vector<PointLight> &World::lights() const {
	return lights_;
}

Intersections World::intersect(const Ray &ray) const {
	Intersections res;
	for (ObjectId id = 0; id < objects_.size(); ++id) {
		res.append(objects_.get(id).intersect(ray), id);
	}
	res.sort();
	return res;
}

Color World::calc(const Ray &ray, const Color &background) const {
	const Intersections xs = intersect(ray);
	const Intersection *hit = xs.hit();
	if (hit == nullptr) {
		return background;
	}

	return shade_hit(Computations::prepare(*hit, ray, objects_));
}

const PointLight &World::single_light() const {
	if (lights_.size() != 1) {
		throw UnsupportedLightCount("World needs exactly one light source, found " + std::to_string(lights_.size()), lights_.size());
	}
	return lights_.front();
}

bool World::is_shadowed(const Point4 &point) const {
	const PointLight &light = single_light();

	const Vec4 to_light = light.position() - point;
	const double distance = to_light.magnitude();
	const Ray shadow_ray(point, to_light.normalized());

	const Intersections xs = intersect(shadow_ray);
	const Intersection *hit = xs.hit();
	return hit != nullptr && hit->t < distance - EPSILON;
}

Color World::shade_hit(const Computations &comps) const {
	const PointLight &light = single_light();
	const bool shadowed = is_shadowed(comps.over_point);
	return light.shade(objects_.get(comps.object), comps.point, comps.eye, comps.normal, shadowed);
}

}
