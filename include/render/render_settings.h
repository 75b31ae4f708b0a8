#ifndef LRE_INCLUDE_RENDER_RENDER_SETTINGS_H
#define LRE_INCLUDE_RENDER_RENDER_SETTINGS_H

#include <basic/color.h>
#include <basic/vec4.h>
#include <string>

namespace lre {

// Run-time settings of a render.
struct RenderSettings {
	std::string scene = "spheres";
	std::string output = "spheres.ppm";
	int width = 500;
	int height = 250;
	double field_of_view = 1.0471975511965976; // pi / 3
	Point4 from = point(0.0, 1.5, -5.0);
	Point4 to = point(0.0, 1.0, 0.0);
	Vec4 up = vector(0.0, 1.0, 0.0);
	Color background = Color::black();
	bool show_help = false;
};

// Reads --scene, --output, --width, --height and --fov (degrees) into settings.
// When --scene is given without --output, the output becomes "<scene>.ppm".
// Returns false and fills error on an unknown flag, a missing value or a bad number.
bool parse_render_settings(int argc, const char *const argv[], RenderSettings &settings, std::string &error);

// Usage text for the command line program.
std::string render_usage(const std::string &program);

}

#endif
