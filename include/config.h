#ifndef PRT_INCLUDE_CONFIG_H
#define PRT_INCLUDE_CONFIG_H

#include <basic/math.h>
#include <string>

namespace prt {

// Run-time settings of the render application.
struct RenderOptions {
	int width = 1300;
	int height = 900;
	double fov = PI / 3.0; // Vertical field of view in radians
	std::string output = "render.ppm";
	std::string assets = "assets"; // Directory searched for <id>.ppm textures

	// Camera navigation applied before each frame
	double yaw = 0.0;
	double pitch = 0.0;
	double zoom = 0.0;
	int frames = 1;

	bool help = false;
};

// Parse command line flags into options. Throws std::invalid_argument on an
// unknown flag, a missing value or a bad number.
RenderOptions parse_render_options(int argc, const char *const argv[]);

// Usage text for --help.
std::string render_usage(const std::string &program);

// Output file for one frame: the plain output path for single frame runs,
// "<stem>_NNN.ppm" otherwise.
std::string frame_path(const std::string &output, int frame, int frames);

}

#endif
