#include <basic/error.h>
#include <basic/matrix.h>
#include <catch2/catch.hpp>

using namespace lre;

TEST_CASE("Mat4 multiplication", "[basic][matrix]") {
	const Mat4 a(1, 2, 3, 4, 5, 6, 7, 8, 9, 8, 7, 6, 5, 4, 3, 2);
	const Mat4 b(-2, 1, 2, 3, 3, 2, 1, -1, 4, 3, 6, 5, 1, 2, 7, 8);

	SECTION("Matrix by matrix") {
		REQUIRE(a * b == Mat4(20, 22, 50, 48, 44, 54, 114, 108, 40, 58, 110, 102, 16, 26, 46, 42));
	}

	SECTION("Matrix by tuple") {
		const Mat4 m(1, 2, 3, 4, 2, 4, 4, 2, 8, 6, 4, 1, 0, 0, 0, 1);
		REQUIRE(m * Vec4(1, 2, 3, 1) == Vec4(18, 24, 33, 1));
	}

	SECTION("Identity leaves matrices and tuples unchanged") {
		REQUIRE(a * Mat4::identity() == a);
		REQUIRE(Mat4::identity() * Vec4(1, 2, 3, 4) == Vec4(1, 2, 3, 4));
	}
}

TEST_CASE("Mat4 transpose", "[basic][matrix]") {
	const Mat4 a(0, 9, 3, 0, 9, 8, 0, 8, 1, 8, 5, 3, 0, 0, 5, 8);
	REQUIRE(a.transpose() == Mat4(0, 9, 1, 0, 9, 8, 8, 0, 3, 0, 5, 5, 0, 8, 3, 8));
	REQUIRE(Mat4::identity().transpose() == Mat4::identity());
}

TEST_CASE("Mat4 inversion", "[basic][matrix]") {
	SECTION("Reference inverses") {
		const Mat4 a(8, -5, 9, 2, 7, 5, 6, 1, -6, 0, 9, 6, -3, 0, -9, -4);
		REQUIRE(a.inverse() == Mat4(-0.15385, -0.15385, -0.28205, -0.53846,
								   -0.07692, 0.12308, 0.02564, 0.03077,
								   0.35897, 0.35897, 0.43590, 0.92308,
								   -0.69231, -0.69231, -0.76923, -1.92308));

		const Mat4 b(9, 3, 0, 9, -5, -2, -6, -3, -4, 9, 6, 4, -7, 6, 6, 2);
		REQUIRE(b.inverse() == Mat4(-0.04074, -0.07778, 0.14444, -0.22222,
								   -0.07778, 0.03333, 0.36667, -0.33333,
								   -0.02901, -0.14630, -0.10926, 0.12963,
								   0.17778, 0.06667, -0.26667, 0.33333));
	}

	SECTION("Multiplying a product by an inverse recovers the factor") {
		const Mat4 a(3, -9, 7, 3, 3, -8, 2, -9, -4, 4, 4, 1, -6, 5, -1, 1);
		const Mat4 b(8, 2, 2, 2, 3, -1, 7, 0, 7, 0, 5, 4, 6, -2, 0, 5);
		REQUIRE((a * b) * b.inverse() == a);
	}

	SECTION("A singular matrix cannot be inverted") {
		const Mat4 singular(-4, 2, -2, -3, 9, 6, 2, 6, 0, -5, 1, -5, 0, 0, 0, 0);
		Mat4 out;
		REQUIRE_FALSE(singular.try_inverse(out));
		REQUIRE_THROWS_AS(singular.inverse(), NonInvertibleMatrix);
	}
}
