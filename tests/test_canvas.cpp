#include <basic/error.h>
#include <canvas.h>
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>

using namespace lre;

TEST_CASE("Canvas construction", "[canvas]") {
	const Canvas canvas(10, 20);
	REQUIRE(canvas.width() == 10);
	REQUIRE(canvas.height() == 20);
	for (int y = 0; y < canvas.height(); ++y) {
		for (int x = 0; x < canvas.width(); ++x) {
			REQUIRE(canvas.at(x, y) == Color::black());
		}
	}

	REQUIRE(Canvas(2, 2, Color(0.2, 0.2, 0.2)).at(1, 1) == Color(0.2, 0.2, 0.2));
	REQUIRE_THROWS_AS(Canvas(0, 5), std::invalid_argument);
	REQUIRE_THROWS_AS(Canvas(5, -1), std::invalid_argument);
}

TEST_CASE("Writing pixels", "[canvas]") {
	Canvas canvas(10, 20);
	const Color red(1, 0, 0);
	canvas.write(2, 3, red);
	REQUIRE(canvas.at(2, 3) == red);
	REQUIRE(canvas.at(3, 2) == Color::black());

	SECTION("Out of bounds") {
		REQUIRE_THROWS_AS(canvas.write(10, 0, red), CanvasOutOfBounds);
		REQUIRE_THROWS_AS(canvas.write(0, 20, red), CanvasOutOfBounds);
		REQUIRE_THROWS_AS(canvas.write(-1, 0, red), CanvasOutOfBounds);
		REQUIRE_THROWS_AS(canvas.at(0, -1), CanvasOutOfBounds);
		// CanvasOutOfBounds is also an std::out_of_range
		REQUIRE_THROWS_AS(canvas.at(10, 20), std::out_of_range);
	}

	SECTION("Fill") {
		canvas.fill(red);
		REQUIRE(canvas.at(0, 0) == red);
		REQUIRE(canvas.at(9, 19) == red);
	}
}

TEST_CASE("PPM output", "[canvas][ppm]") {
	Canvas canvas(5, 3);
	canvas.write(0, 0, Color(1.5, 0, 0));
	canvas.write(2, 1, Color(0, 0.5, 0));
	canvas.write(4, 2, Color(-0.5, 0, 1));

	const std::string ppm = canvas.to_ppm();
	REQUIRE(ppm ==
		"P3\n"
		"5 3\n"
		"255\n"
		"255 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n"
		"0 0 0 0 0 0 0 128 0 0 0 0 0 0 0\n"
		"0 0 0 0 0 0 0 0 0 0 0 0 0 0 255");

	SECTION("No trailing newline") {
		REQUIRE(ppm.back() == '5');
	}

	SECTION("Same canvas gives the same text") {
		REQUIRE(canvas.to_ppm() == ppm);
	}
}

TEST_CASE("Color channels for PPM", "[canvas][ppm][color]") {
	REQUIRE(Color(0.5, 1.0, 0.0).to_ppm() == "128 255 0");
	REQUIRE(Color(2.0, -1.0, 0.2).to_ppm() == "255 0 51");
}

TEST_CASE("Saving PPM files", "[canvas][ppm]") {
	const Canvas canvas(2, 2);
	REQUIRE_FALSE(canvas.save_ppm("image.png"));
	REQUIRE_FALSE(canvas.save_ppm("ppm"));
	REQUIRE_FALSE(canvas.save_ppm("/nonexistent-directory/image.ppm"));
}
