#include <basic/error.h>
#include <basic/vec4.h>
#include <catch2/catch.hpp>
#include <cmath>

using namespace lre;

/// Points carry w = 1, vectors w = 0; arithmetic keeps the homogeneous tag consistent.
TEST_CASE("Vec4 tuple arithmetic", "[basic][vec4]") {
	SECTION("Point and vector tags") {
		REQUIRE(point(4.0, -4.0, 3.0).is_point());
		REQUIRE(vector(4.0, -4.0, 3.0).is_vector());
		REQUIRE(Vec4(4.3, -4.2, 3.1, 1.0).w() == 1.0);
	}

	SECTION("Adding a vector to a point gives a point") {
		REQUIRE(Vec4(3, -2, 5, 1) + Vec4(-2, 3, 1, 0) == Vec4(1, 1, 6, 1));
	}

	SECTION("Subtracting two points gives a vector") {
		REQUIRE(point(3, 2, 1) - point(5, 6, 7) == vector(-2, -4, -6));
		REQUIRE(point(3, 2, 1) - vector(5, 6, 7) == point(-2, -4, -6));
		REQUIRE(vector(3, 2, 1) - vector(5, 6, 7) == vector(-2, -4, -6));
	}

	SECTION("Negation, scaling and division") {
		REQUIRE(-Vec4(1, -2, 3, -4) == Vec4(-1, 2, -3, 4));
		REQUIRE(Vec4(1, -2, 3, -4) * 3.5 == Vec4(3.5, -7, 10.5, -14));
		REQUIRE(0.5 * Vec4(1, -2, 3, -4) == Vec4(0.5, -1, 1.5, -2));
		REQUIRE(Vec4(1, -2, 3, -4) / 2.0 == Vec4(0.5, -1, 1.5, -2));
	}

	SECTION("Division by a near-zero scalar is reported") {
		REQUIRE_THROWS_AS(vector(1, 2, 3) / 0.0, DivisionByZero);
		REQUIRE_THROWS_AS(vector(1, 2, 3) / 1e-6, DivisionByZero);
	}
}

TEST_CASE("Vec4 magnitude and normalization", "[basic][vec4]") {
	REQUIRE(vector(1, 0, 0).magnitude() == Approx(1.0));
	REQUIRE(vector(1, 2, 3).magnitude() == Approx(std::sqrt(14.0)));
	REQUIRE(vector(-1, -2, -3).magnitude() == Approx(std::sqrt(14.0)));

	REQUIRE(vector(4, 0, 0).normalized() == vector(1, 0, 0));
	REQUIRE(vector(1, 2, 3).normalized() == vector(0.26726, 0.53452, 0.80178));
	REQUIRE(vector(1, 2, 3).normalized().magnitude() == Approx(1.0));

	SECTION("Normalizing a zero vector is reported") {
		REQUIRE_THROWS_AS(vector(0, 0, 0).normalized(), DivisionByZero);
	}
}

TEST_CASE("Vec4 dot, cross and reflect", "[basic][vec4]") {
	REQUIRE(dot(vector(1, 2, 3), vector(2, 3, 4)) == Approx(20.0));
	REQUIRE(cross(vector(1, 2, 3), vector(2, 3, 4)) == vector(-1, 2, -1));
	REQUIRE(cross(vector(2, 3, 4), vector(1, 2, 3)) == vector(1, -2, 1));

	SECTION("Reflecting a vector approaching at 45 degrees") {
		REQUIRE(reflect(vector(1, -1, 0), vector(0, 1, 0)) == vector(1, 1, 0));
	}

	SECTION("Reflecting a vector off a slanted surface") {
		const double h = std::sqrt(2.0) / 2.0;
		REQUIRE(reflect(vector(0, -1, 0), vector(h, h, 0)) == vector(1, 0, 0));
	}
}

TEST_CASE("Vec4 equality is epsilon tolerant", "[basic][vec4]") {
	REQUIRE(point(1, 2, 3) == point(1.00001, 2.00001, 3.0));
	REQUIRE(point(1, 2, 3) != point(1.001, 2, 3));
	REQUIRE(point(1, 2, 3) != vector(1, 2, 3));
}
