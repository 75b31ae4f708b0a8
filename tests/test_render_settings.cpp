#include <catch2/catch.hpp>
#include <render/render_settings.h>
#include <string>

using namespace lre;

TEST_CASE("Render settings defaults", "[settings]") {
	const RenderSettings settings;
	REQUIRE(settings.scene == "spheres");
	REQUIRE(settings.output == "spheres.ppm");
	REQUIRE(settings.width == 500);
	REQUIRE(settings.height == 250);
	REQUIRE(settings.field_of_view == Approx(3.14159265358979323846 / 3));
	REQUIRE(settings.from == point(0, 1.5, -5));
	REQUIRE(settings.to == point(0, 1, 0));
	REQUIRE(settings.up == vector(0, 1, 0));
	REQUIRE(settings.background == Color::black());
	REQUIRE_FALSE(settings.show_help);

	SECTION("No arguments keep the defaults") {
		const char *argv[] = { "lumen_render" };
		RenderSettings parsed;
		std::string error;
		REQUIRE(parse_render_settings(1, argv, parsed, error));
		REQUIRE(parsed.output == "spheres.ppm");
		REQUIRE(error.empty());
	}
}

TEST_CASE("Parsing render settings", "[settings]") {
	RenderSettings settings;
	std::string error;

	SECTION("All flags") {
		const char *argv[] = { "lumen_render", "--scene", "planes", "--output", "out.ppm", "--width", "64", "--height", "32", "--fov", "90" };
		REQUIRE(parse_render_settings(11, argv, settings, error));
		REQUIRE(settings.scene == "planes");
		REQUIRE(settings.output == "out.ppm");
		REQUIRE(settings.width == 64);
		REQUIRE(settings.height == 32);
		REQUIRE(settings.field_of_view == Approx(3.14159265358979323846 / 2));
	}

	SECTION("Output follows the scene") {
		const char *argv[] = { "lumen_render", "--scene", "patterns" };
		REQUIRE(parse_render_settings(3, argv, settings, error));
		REQUIRE(settings.output == "patterns.ppm");
	}

	SECTION("Help") {
		const char *argv[] = { "lumen_render", "--help" };
		REQUIRE(parse_render_settings(2, argv, settings, error));
		REQUIRE(settings.show_help);
	}

	SECTION("Bad width") {
		const char *argv[] = { "lumen_render", "--width", "12px" };
		REQUIRE_FALSE(parse_render_settings(3, argv, settings, error));
		REQUIRE(error.find("width") != std::string::npos);
	}

	SECTION("Non-positive height") {
		const char *argv[] = { "lumen_render", "--height", "0" };
		REQUIRE_FALSE(parse_render_settings(3, argv, settings, error));
	}

	SECTION("Field of view out of range") {
		const char *argv[] = { "lumen_render", "--fov", "180" };
		REQUIRE_FALSE(parse_render_settings(3, argv, settings, error));
		REQUIRE(error.find("fov") != std::string::npos);
	}

	SECTION("Unknown flag") {
		const char *argv[] = { "lumen_render", "--depth", "3" };
		REQUIRE_FALSE(parse_render_settings(3, argv, settings, error));
		REQUIRE(error == "unknown option --depth");
	}

	SECTION("Missing value") {
		const char *argv[] = { "lumen_render", "--scene" };
		REQUIRE_FALSE(parse_render_settings(2, argv, settings, error));
		REQUIRE(error == "missing value for --scene");
	}
}

TEST_CASE("Usage text", "[settings]") {
	const std::string usage = render_usage("lumen_render");
	REQUIRE(usage.find("Usage: lumen_render") == 0);
	REQUIRE(usage.find("--scene") != std::string::npos);
}
