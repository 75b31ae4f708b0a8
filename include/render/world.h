#ifndef LRE_INCLUDE_RENDER_WORLD_H
#define LRE_INCLUDE_RENDER_WORLD_H

#include <basic/color.h>
#include <basic/ray.h>
#include <basic/vec4.h>
#include <intersection/computations.h>
#include <intersection/intersection.h>
#include <light/point_light.h>
#include <memory>
#include <object/object_set.h>
#include <utility>
#include <vector>

namespace lre {

// Objects and light sources of a scene.
class World {
public:
	World() = default;

	World(const World &) = delete;
	World &operator=(const World &) = delete;
	World(World &&) = default;
	World &operator=(World &&) = default;

	// Takes ownership and returns the handle of the object.
	ObjectId add_object(std::unique_ptr<Object> object);

	// Construct an object in place. Returns its handle.
	template <typename T, typename... Args>
	ObjectId emplace_object(Args &&...args) {
		return add_object(std::make_unique<T>(std::forward<Args>(args)...));
	}

	void add_light(const PointLight &light);

	ObjectSet &objects();
	const ObjectSet &objects() const;
	const std::vector<PointLight> &lights() const;

	// The t-values of every object against the ray, tagged with the object and sorted once.
	Intersections intersect(const Ray &ray) const;

	// Color seen along the ray: background without a hit, else the shaded hit.
	Color calc(const Ray &ray, const Color &background) const;

	// Whether the light is blocked between the point and the light.
	// Throws UnsupportedLightCount unless the world holds exactly one light.
	bool is_shadowed(const Point4 &point) const;

	// Shadow test at the over-point, then the light's shade.
	Color shade_hit(const Computations &comps) const;

private:
	const PointLight &single_light() const;

	ObjectSet objects_;
	std::vector<PointLight> lights_;
};

}

#endif
