#include <basic/math.h>
#include <material/material.h>

namespace lre {

Material::Material(const Color &color, double ambient, double diffuse, double specular, double shininess)
	: color(color), ambient(ambient), diffuse(diffuse), specular(specular), shininess(shininess) {
}

bool operator==(const Material &a, const Material &b) {
	return a.color == b.color && feq(a.ambient, b.ambient) && feq(a.diffuse, b.diffuse) && feq(a.specular, b.specular) && feq(a.shininess, b.shininess) && a.pattern == b.pattern;
}

bool operator!=(const Material &a, const Material &b) {
	return !(a == b);
}

}
