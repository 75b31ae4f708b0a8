#include "scenes.h"

#include <algorithm>
#include <array>
#include <material/gradient.h>
#include <material/stripe.h>
#include <memory>
#include <object/marker.h>
#include <object/plane.h>
#include <object/sphere.h>
#include <stdexcept>
#include <transform/transformation.h>

namespace lre::app {

namespace {

constexpr double PI = 3.14159265358979323846;

Material matte(const Color &color) {
	Material m;
	m.color = color;
	m.specular = 0.0;
	return m;
}

Material glossy(const Color &color) {
	Material m;
	m.color = color;
	m.diffuse = 0.7;
	m.specular = 0.3;
	return m;
}

// The three spheres shared by every ray traced scene. Returns their handles: middle, right, left.
std::array<ObjectId, 3> add_spheres(World &world) {
	const ObjectId middle = world.emplace_object<Sphere>();
	world.objects().get(middle).set_transform(Transformation { TransformUnit::translate(-0.5, 1.0, 0.5) });
	world.objects().get(middle).set_material(glossy(Color(0.1, 1.0, 0.5)));

	const ObjectId right = world.emplace_object<Sphere>();
	world.objects().get(right).set_transform(Transformation {
		TransformUnit::scale(0.5, 0.5, 0.5),
		TransformUnit::translate(1.5, 0.5, -0.5) });
	world.objects().get(right).set_material(glossy(Color(0.5, 1.0, 0.1)));

	const ObjectId left = world.emplace_object<Sphere>();
	world.objects().get(left).set_transform(Transformation {
		TransformUnit::scale(0.33, 0.33, 0.33),
		TransformUnit::translate(-1.5, 0.33, -0.75) });
	world.objects().get(left).set_material(glossy(Color(1.0, 0.8, 0.1)));

	return { middle, right, left };
}

void add_light(World &world) {
	world.add_light(PointLight(point(-10.0, 10.0, -10.0), Color::white()));
}

std::shared_ptr<Gradient> stretched_gradient(const Color &a, const Color &b) {
	auto gradient = std::make_shared<Gradient>(a, b);
	gradient->add_transform(TransformUnit::scale(2.0, 1.0, 1.0));
	return gradient;
}

}

bool is_known_scene(const std::string &name) {
	return is_ray_traced_scene(name) || name == "clock";
}

bool is_ray_traced_scene(const std::string &name) {
	return name == "spheres" || name == "planes" || name == "patterns";
}

void build_scene(const std::string &name, World &world) {
	if (name == "spheres") {
		build_spheres(world);
	} else if (name == "planes") {
		build_planes(world);
	} else if (name == "patterns") {
		build_patterns(world);
	} else {
		throw std::invalid_argument("Unknown ray traced scene: " + name);
	}
}

void build_spheres(World &world) {
	const Material wall = matte(Color(1.0, 0.9, 0.9));

	const ObjectId floor = world.emplace_object<Sphere>();
	world.objects().get(floor).add_transform(TransformUnit::scale(10.0, 0.01, 10.0));
	world.objects().get(floor).set_material(wall);

	const ObjectId left_wall = world.emplace_object<Sphere>();
	world.objects().get(left_wall).set_transform(Transformation {
		TransformUnit::scale(10.0, 0.01, 10.0),
		TransformUnit::rotate_x(PI / 2.0),
		TransformUnit::rotate_y(-PI / 4.0),
		TransformUnit::translate(0.0, 0.0, 5.0) });
	world.objects().get(left_wall).set_material(wall);

	const ObjectId right_wall = world.emplace_object<Sphere>();
	world.objects().get(right_wall).set_transform(Transformation {
		TransformUnit::scale(10.0, 0.01, 10.0),
		TransformUnit::rotate_x(PI / 2.0),
		TransformUnit::rotate_y(PI / 4.0),
		TransformUnit::translate(0.0, 0.0, 5.0) });
	world.objects().get(right_wall).set_material(wall);

	add_spheres(world);
	add_light(world);
}

void build_planes(World &world) {
	const auto stripes = std::make_shared<Stripe>();

	const ObjectId floor = world.emplace_object<Plane>();
	world.objects().get(floor).set_material(matte(Color(1.0, 0.9, 0.9)));
	world.objects().get(floor).material().pattern = stripes;

	for (ObjectId id : add_spheres(world)) {
		world.objects().get(id).material().pattern = stripes;
	}
	add_light(world);
}

void build_patterns(World &world) {
	const ObjectId floor = world.emplace_object<Plane>();
	world.objects().get(floor).set_material(matte(Color(1.0, 0.9, 0.9)));
	world.objects().get(floor).material().pattern = std::make_shared<Stripe>(Color(0.83, 0.83, 0.83), Color(0.9, 1.0, 1.0));

	const std::array<ObjectId, 3> spheres = add_spheres(world);
	world.objects().get(spheres[0]).material().pattern = stretched_gradient(Color(0.0, 0.0, 1.0), Color(0.5, 0.0, 0.5));
	world.objects().get(spheres[1]).material().pattern = stretched_gradient(Color(1.0, 0.0, 0.0), Color(1.0, 0.65, 0.0));
	world.objects().get(spheres[2]).material().pattern = stretched_gradient(Color(0.0, 0.5, 0.0), Color(1.0, 1.0, 0.0));

	add_light(world);
}

Canvas draw_clock(int width, int height) {
	Canvas canvas(width, height, Color(0.2, 0.2, 0.2));

	const double radius = std::min(width, height) / 4.0;
	for (int hour = 0; hour < 12; ++hour) {
		Marker marker(point(0.0, 0.0, 0.0), Color(0.5, 0.5, 0.5));
		marker.set_transform(Transformation {
			TransformUnit::translate(radius, 0.0, 0.0),
			TransformUnit::rotate_z(hour * (PI / 6.0)),
			TransformUnit::translate(width / 2.0, height / 2.0, 0.0) });
		marker.draw(canvas);
	}
	return canvas;
}

}
