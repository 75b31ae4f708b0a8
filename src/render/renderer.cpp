#include <render/renderer.h>

namespace lre {

Renderer::Renderer(int width, int height, double field_of_view, const Point4 &from, const Point4 &to, const Vec4 &up, const Color &background)
	: camera_(width, height, field_of_view), canvas_(width, height, background), background_(background) {
	camera_.set_view(from, to, up);
}

World &Renderer::world() {
	return world_;
}

const World &Renderer::world() const {
	return world_;
}

Camera &Renderer::camera() {
	return camera_;
}

const Camera &Renderer::camera() const {
	return camera_;
}

const Canvas &Renderer::canvas() const {
	return canvas_;
}

const Color &Renderer::background() const {
	return background_;
}

void Renderer::render(std::ostream *progress) {
	for (int y = 0; y < camera_.vsize(); ++y) {
		if (progress != nullptr) {
			*progress << "\rProgress: " << y + 1 << "/" << camera_.vsize() << std::flush;
		}
		for (int x = 0; x < camera_.hsize(); ++x) {
			canvas_.write(x, y, world_.calc(camera_.ray_for_pixel(x, y), background_));
		}
	}
	if (progress != nullptr) {
		*progress << "\n";
	}
}

bool Renderer::save_ppm(const std::string &file_path) const {
	return canvas_.save_ppm(file_path);
}

}
