#ifndef LRE_APP_SCENES_H
#define LRE_APP_SCENES_H

#include <canvas.h>
#include <render/world.h>
#include <string>

namespace lre::app {

// Whether name is one of the scenes below.
bool is_known_scene(const std::string &name);

// Whether the scene is rendered through the camera (everything but the clock).
bool is_ray_traced_scene(const std::string &name);

// Fill a world with the named ray traced scene. Throws std::invalid_argument for an unknown name.
void build_scene(const std::string &name, World &world);

// Flattened spheres as floor and walls, three spheres in the middle.
void build_spheres(World &world);

// Striped plane floor and three striped spheres.
void build_planes(World &world);

// Striped floor and three spheres with gradients.
void build_patterns(World &world);

// Twelve hour markers on a clock face, drawn without ray tracing.
Canvas draw_clock(int width, int height);

}

#endif
