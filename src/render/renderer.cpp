#include <cmath>
#include <render/renderer.h>
#include <render/tracer.h>

namespace prt {

Ray primary_ray(const Camera &camera, int x, int y, int width, int height, double fov) {
	double aspect_ratio = static_cast<double>(width) / height;
	double perspective_scale = std::tan(fov * 0.5);

	// Screen space in [-1, 1], y up.
	double screen_x = (2.0 * x) / width - 1.0;
	double screen_y = -(2.0 * y) / height + 1.0;

	screen_x *= aspect_ratio * perspective_scale;
	screen_y *= perspective_scale;

	Vec3 direction = Vec3(screen_x, screen_y, -1.0).normalized();
	return Ray(camera.eye(), camera.basis_change(direction));
}

void render(Texture &framebuffer, const Scene &scene, const Camera &camera, const TextureLookup &textures, double fov) {
	int width = framebuffer.width();
	int height = framebuffer.height();

	for (int y = 0; y < height; ++y) {
		for (int x = 0; x < width; ++x) {
			Ray ray = primary_ray(camera, x, y, width, height, fov);
			framebuffer.pixel(x, y) = cast_ray(ray, scene, textures, 0);
		}
	}
}

}
