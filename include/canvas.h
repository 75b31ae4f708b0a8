#ifndef LRE_INCLUDE_CANVAS_H
#define LRE_INCLUDE_CANVAS_H

#include <basic/color.h>
#include <string>
#include <vector>

namespace lre {

class Canvas {
public:
	// Constructors
	Canvas(int width, int height, const Color &fill_color = Color::black()); // Initialize the image by filling with a color.

	// Write / read a pixel. Throws CanvasOutOfBounds outside [0, width) x [0, height).
	void write(int x, int y, const Color &color);
	const Color &at(int x, int y) const;

	// Fill every pixel with a color.
	void fill(const Color &color);

	int width() const;
	int height() const;

	// ASCII PPM ("P3") text of the canvas.
	std::string to_ppm() const;

	// Save the canvas to a file (only .ppm is supported). Returns false if the path is not .ppm or cannot be written.
	bool save_ppm(const std::string &file_path) const;

private:
	std::size_t index(int x, int y) const;

	int width_, height_; // The image width and height.

	// [WARN]: Row-major, so pixel (x, y) lives at y * width + x.
	std::vector<Color> pixels_;
};

}

#endif
