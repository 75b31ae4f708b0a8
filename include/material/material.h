#ifndef LRE_INCLUDE_MATERIAL_MATERIAL_H
#define LRE_INCLUDE_MATERIAL_MATERIAL_H

#include <basic/color.h>
#include <material/pattern.h>
#include <memory>

namespace lre {

// Phong reflection model material
struct Material {
	Color color = Color::white(); // Reflected spectrum of the surface
	double ambient = 0.1;
	double diffuse = 0.9;
	double specular = 0.9;
	double shininess = 200.0;

	// Optional surface pattern, replaces color when set
	std::shared_ptr<const Pattern> pattern;

	// Constructors
	Material() = default;
	Material(const Color &color, double ambient, double diffuse, double specular, double shininess);
};

// Compares the Phong parameters with EPSILON precision and the pattern by identity
bool operator==(const Material &a, const Material &b);
bool operator!=(const Material &a, const Material &b);

}

#endif
