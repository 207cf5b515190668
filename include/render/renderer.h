#ifndef PRT_INCLUDE_RENDER_RENDERER_H
#define PRT_INCLUDE_RENDER_RENDERER_H

#include <basic/ray.h>
#include <camera.h>
#include <scene.h>
#include <texture.h>
#include <texture_lookup.h>

namespace prt {

// Ray from the camera eye through pixel (x, y) of a width x height image,
// fov is the vertical field of view in radians.
Ray primary_ray(const Camera &camera, int x, int y, int width, int height, double fov);

// Trace one ray per pixel of the frame buffer, writing colors in place.
void render(Texture &framebuffer, const Scene &scene, const Camera &camera, const TextureLookup &textures, double fov);

}

#endif
