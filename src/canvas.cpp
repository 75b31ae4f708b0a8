#include <basic/error.h>
#include <canvas.h>
#include <fstream>
#include <stdexcept>

namespace lre {

Canvas::Canvas(int width, int height, const Color &fill_color) : width_(width), height_(height) {
	if (width <= 0 || height <= 0) {
		throw std::invalid_argument("Canvas width and height must be positive.");
	}
	pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fill_color);
}

std::size_t Canvas::index(int x, int y) const {
	if (x < 0 || y < 0 || x >= width_ || y >= height_) {
		throw CanvasOutOfBounds("Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") is out of bounds of a " + std::to_string(width_) + "x" + std::to_string(height_) + " canvas");
	}
	return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
}

void Canvas::write(int x, int y, const Color &color) {
	pixels_[index(x, y)] = color;
}

const Color &Canvas::at(int x, int y) const {
	return pixels_[index(x, y)];
}

void Canvas::fill(const Color &color) {
	for (Color &pixel : pixels_) {
		pixel = color;
	}
}

int Canvas::width() const {
	return width_;
}

int Canvas::height() const {
	return height_;
}

std::string Canvas::to_ppm() const {
	// PPM header
	std::string ppm = "P3\n" + std::to_string(width_) + " " + std::to_string(height_) + "\n255\n";

	// One line per row, no trailing whitespace
	for (int y = 0; y < height_; ++y) {
		for (int x = 0; x < width_; ++x) {
			if (x > 0) {
				ppm += ' ';
			}
			ppm += pixels_[static_cast<std::size_t>(y) * width_ + x].to_ppm();
		}
		ppm += '\n';
	}

	// The whole text is trimmed at the end
	while (!ppm.empty() && (ppm.back() == '\n' || ppm.back() == ' ')) {
		ppm.pop_back();
	}
	return ppm;
}

bool Canvas::save_ppm(const std::string &file_path) const {
	// Only support PPM format for simplicity.
	if (file_path.size() < 4 || file_path.substr(file_path.size() - 4) != ".ppm") {
		return false;
	}

	std::ofstream out(file_path, std::ios::binary);
	if (!out) {
		return false;
	}

	const std::string ppm = to_ppm();
	out.write(ppm.data(), static_cast<std::streamsize>(ppm.size()));
	return static_cast<bool>(out);
}

}
