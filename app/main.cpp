#include "scenes.h"

#include <exception>
#include <iostream>
#include <render/render_settings.h>
#include <render/renderer.h>
#include <string>

int main(int argc, char **argv) {
	lre::RenderSettings settings;
	std::string error;
	if (!lre::parse_render_settings(argc, argv, settings, error)) {
		std::cerr << "Error: " << error << "\n"
				  << lre::render_usage(argv[0]);
		return 2;
	}
	if (settings.show_help) {
		std::cout << lre::render_usage(argv[0]);
		return 0;
	}
	if (!lre::app::is_known_scene(settings.scene)) {
		std::cerr << "Error: unknown scene " << settings.scene << "\n"
				  << lre::render_usage(argv[0]);
		return 2;
	}

	try {
		if (!lre::app::is_ray_traced_scene(settings.scene)) {
			const lre::Canvas canvas = lre::app::draw_clock(settings.width, settings.height);
			if (!canvas.save_ppm(settings.output)) {
				std::cerr << "Failed to write: " << settings.output << "\n";
				return 1;
			}
			std::cout << "Wrote " << settings.output << " (" << settings.width << "x" << settings.height << ")\n";
			return 0;
		}

		lre::Renderer renderer(settings.width, settings.height, settings.field_of_view,
			settings.from, settings.to, settings.up, settings.background);
		lre::app::build_scene(settings.scene, renderer.world());

		std::cout << "Rendering " << settings.scene << " (" << settings.width << "x" << settings.height << ")..." << std::endl;
		renderer.render(&std::cerr);

		if (!renderer.save_ppm(settings.output)) {
			std::cerr << "Failed to write: " << settings.output << "\n";
			return 1;
		}
		std::cout << "Wrote " << settings.output << "\n";
	} catch (const std::exception &e) {
		std::cerr << "Fatal: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
