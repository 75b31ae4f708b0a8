#include <cmath>
#include <render/render_settings.h>
#include <stdexcept>

namespace lre {

namespace {

constexpr double PI = 3.14159265358979323846;

bool parse_int(const std::string &text, int &out) {
	try {
		std::size_t used = 0;
		const int value = std::stoi(text, &used);
		if (used != text.size()) {
			return false;
		}
		out = value;
		return true;
	} catch (const std::logic_error &) {
		// std::invalid_argument or std::out_of_range
		return false;
	}
}

bool parse_double(const std::string &text, double &out) {
	try {
		std::size_t used = 0;
		const double value = std::stod(text, &used);
		if (used != text.size() || !std::isfinite(value)) {
			return false;
		}
		out = value;
		return true;
	} catch (const std::logic_error &) {
		return false;
	}
}

}

bool parse_render_settings(int argc, const char *const argv[], RenderSettings &settings, std::string &error) {
	bool output_given = false;

	for (int i = 1; i < argc; ++i) {
		const std::string flag = argv[i];
		if (flag == "-h" || flag == "--help") {
			settings.show_help = true;
			continue;
		}

		if (i + 1 >= argc) {
			error = "missing value for " + flag;
			return false;
		}
		const std::string value = argv[++i];

		if (flag == "--scene") {
			settings.scene = value;
		} else if (flag == "--output") {
			settings.output = value;
			output_given = true;
		} else if (flag == "--width") {
			if (!parse_int(value, settings.width) || settings.width <= 0) {
				error = "width must be a positive integer, got " + value;
				return false;
			}
		} else if (flag == "--height") {
			if (!parse_int(value, settings.height) || settings.height <= 0) {
				error = "height must be a positive integer, got " + value;
				return false;
			}
		} else if (flag == "--fov") {
			double degrees = 0.0;
			if (!parse_double(value, degrees) || degrees <= 0.0 || degrees >= 180.0) {
				error = "fov must be in (0, 180) degrees, got " + value;
				return false;
			}
			settings.field_of_view = degrees * PI / 180.0;
		} else {
			error = "unknown option " + flag;
			return false;
		}
	}

	if (!output_given) {
		settings.output = settings.scene + ".ppm";
	}
	return true;
}

std::string render_usage(const std::string &program) {
	return "Usage: " + program + " [--scene spheres|planes|patterns|clock] [--output FILE.ppm]\n"
		"       [--width N] [--height N] [--fov DEGREES]\n";
}

}
