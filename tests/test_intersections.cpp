#include "test_helpers.h"

#include <basic/math.h>
#include <catch2/catch.hpp>
#include <intersection/computations.h>
#include <intersection/intersection.h>
#include <limits>
#include <memory>
#include <object/object_set.h>
#include <object/sphere.h>
#include <stdexcept>

using namespace lre;

TEST_CASE("Intersections are kept in ascending order", "[intersection]") {
	SECTION("Initializer list") {
		const Intersections xs { { 5.0, 0 }, { 7.0, 0 }, { -3.0, 0 }, { 2.0, 0 } };
		REQUIRE(xs.size() == 4);
		REQUIRE(xs[0].t == -3.0);
		REQUIRE(xs[1].t == 2.0);
		REQUIRE(xs[2].t == 5.0);
		REQUIRE(xs[3].t == 7.0);
	}

	SECTION("Created from t-values") {
		const Intersections xs = Intersections::create({ 6.0, 4.0 }, 3);
		REQUIRE(xs.size() == 2);
		REQUIRE(xs[0].t == 4.0);
		REQUIRE(xs[1].t == 6.0);
		REQUIRE(xs[0].object == 3);
		REQUIRE(xs[1].object == 3);
	}

	SECTION("Combined from several objects") {
		const Intersections xs = Intersections::combine({ { 2.0, 1 }, { 1.0, 0 }, { 1.5, 1 } });
		REQUIRE(xs[0].object == 0);
		REQUIRE(xs[1].t == 1.5);
		REQUIRE(xs[2].t == 2.0);
	}

	SECTION("Append then sort") {
		Intersections xs;
		REQUIRE(xs.empty());
		xs.append({ 3.0, 1.0 }, 0);
		xs.append(Intersection(2.0, 1));
		REQUIRE(xs[0].t == 3.0);
		xs.sort();
		REQUIRE(xs[0].t == 1.0);
		REQUIRE(xs[1].t == 2.0);
		REQUIRE(xs[1].object == 1);
		REQUIRE(xs[2].t == 3.0);
	}

	SECTION("Equal t-values keep insertion order") {
		const Intersections xs { { 1.0, 4 }, { 1.0, 2 }, { 0.5, 9 } };
		REQUIRE(xs[1].object == 4);
		REQUIRE(xs[2].object == 2);
	}

	SECTION("Contains") {
		const Intersections xs = Intersections::create({ 1.0, 2.5 }, 0);
		REQUIRE(xs.contains(2.5));
		REQUIRE(xs.contains(2.5 + EPSILON / 10));
		REQUIRE_FALSE(xs.contains(2.0));
	}
}

TEST_CASE("Hit is the smallest non-negative intersection", "[intersection][hit]") {
	SECTION("All positive") {
		const Intersections xs { { 2.0, 0 }, { 1.0, 1 } };
		REQUIRE(xs.hit() != nullptr);
		REQUIRE(xs.hit()->t == 1.0);
		REQUIRE(xs.hit()->object == 1);
	}

	SECTION("Some negative") {
		const Intersections xs { { -1.0, 0 }, { 1.0, 0 } };
		REQUIRE(xs.hit()->t == 1.0);
	}

	SECTION("All negative") {
		const Intersections xs { { -2.0, 0 }, { -1.0, 0 } };
		REQUIRE(xs.hit() == nullptr);
	}

	SECTION("Zero counts as a hit") {
		const Intersections xs { { -1.0, 0 }, { 0.0, 0 } };
		REQUIRE(xs.hit()->t == 0.0);
	}

	SECTION("Unordered input") {
		const Intersections xs { { 5.0, 0 }, { 7.0, 0 }, { -3.0, 0 }, { 2.0, 0 } };
		REQUIRE(xs.hit()->t == 2.0);
	}

	SECTION("Empty list") {
		REQUIRE(Intersections().hit() == nullptr);
	}

	SECTION("NaN never hits and sorts last") {
		const double nan = std::numeric_limits<double>::quiet_NaN();
		const Intersections xs { { nan, 0 }, { 3.0, 1 }, { -1.0, 2 } };
		REQUIRE(xs[0].t == -1.0);
		REQUIRE(xs[1].t == 3.0);
		REQUIRE(xs.hit()->object == 1);

		const Intersections only_nan { { nan, 0 } };
		REQUIRE(only_nan.hit() == nullptr);
	}
}

TEST_CASE("Preparing computations", "[intersection][computations]") {
	ObjectSet objects;
	const ObjectId id = objects.add(std::make_unique<Sphere>());

	SECTION("Hit from outside") {
		const Ray r(point(0, 0, -5), vector(0, 0, 1));
		const Computations comps = Computations::prepare(Intersection(4.0, id), r, objects);
		REQUIRE(comps.t == 4.0);
		REQUIRE(comps.object == id);
		REQUIRE(comps.point == point(0, 0, -1));
		REQUIRE(comps.eye == vector(0, 0, -1));
		REQUIRE(comps.normal == vector(0, 0, -1));
		REQUIRE_FALSE(comps.inside);
	}

	SECTION("Hit from inside flips the normal") {
		const Ray r(point(0, 0, 0), vector(0, 0, 1));
		const Computations comps = Computations::prepare(Intersection(1.0, id), r, objects);
		REQUIRE(comps.point == point(0, 0, 1));
		REQUIRE(comps.eye == vector(0, 0, -1));
		REQUIRE(comps.normal == vector(0, 0, -1));
		REQUIRE(comps.inside);
	}

	SECTION("Over point sits just above the surface") {
		objects.get(id).add_transform(TransformUnit::translate(0, 0, 1));
		const Ray r(point(0, 0, -5), vector(0, 0, 1));
		const Computations comps = Computations::prepare(Intersection(5.0, id), r, objects);
		REQUIRE(comps.over_point.z() < -EPSILON / 2);
		REQUIRE(comps.point.z() > comps.over_point.z());
	}

	SECTION("Unknown object") {
		const Ray r(point(0, 0, -5), vector(0, 0, 1));
		REQUIRE_THROWS_AS(Computations::prepare(Intersection(4.0, 42), r, objects), std::out_of_range);
	}
}
