#include <basic/math.h>
#include <intersection/computations.h>

namespace lre {

Computations Computations::prepare(const Intersection &hit, const Ray &ray, const ObjectSet &objects) {
	Computations comps;
	comps.t = hit.t;
	comps.object = hit.object;
	comps.point = ray.position(hit.t);
	comps.eye = -ray.direction;
	comps.normal = objects.get(hit.object).normal(comps.point);

	if (dot(comps.normal, comps.eye) < 0.0) {
		comps.inside = true;
		comps.normal = -comps.normal;
	} else {
		comps.inside = false;
	}

	comps.over_point = comps.point + EPSILON * comps.normal;
	return comps;
}

}
