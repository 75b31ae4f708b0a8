#ifndef LRE_INCLUDE_RENDER_RENDERER_H
#define LRE_INCLUDE_RENDER_RENDERER_H

#include <basic/color.h>
#include <basic/vec4.h>
#include <canvas.h>
#include <ostream>
#include <render/camera.h>
#include <render/world.h>
#include <string>

namespace lre {

// Owns a world, a camera looking at it and the canvas the camera renders into.
class Renderer {
public:
	// Canvas and camera of width x height pixels, camera placed by view_transform(from, to, up).
	Renderer(int width, int height, double field_of_view, const Point4 &from, const Point4 &to, const Vec4 &up, const Color &background);

	World &world();
	const World &world() const;
	Camera &camera();
	const Camera &camera() const;
	const Canvas &canvas() const;
	const Color &background() const;

	// Shade every pixel in row-major order. Errors from the world or camera propagate and abort the render.
	// Row progress is written to progress when it is not null.
	void render(std::ostream *progress = nullptr);

	// Returns false if the canvas could not be written.
	bool save_ppm(const std::string &file_path) const;

private:
	World world_;
	Camera camera_;
	Canvas canvas_;
	Color background_;
};

}

#endif
