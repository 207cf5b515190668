#include <config.h>
#include <cstdio>
#include <stdexcept>

namespace prt {

namespace {

double parse_double(const std::string &flag, const std::string &value) {
	std::size_t used = 0;
	double result;
	try {
		result = std::stod(value, &used);
	} catch (const std::exception &) {
		throw std::invalid_argument("Invalid number for " + flag + ": " + value);
	}
	if (used != value.size()) {
		throw std::invalid_argument("Invalid number for " + flag + ": " + value);
	}
	return result;
}

int parse_positive_int(const std::string &flag, const std::string &value) {
	std::size_t used = 0;
	int result;
	try {
		result = std::stoi(value, &used);
	} catch (const std::exception &) {
		throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
	}
	if (used != value.size() || result <= 0) {
		throw std::invalid_argument(flag + " must be a positive integer: " + value);
	}
	return result;
}

}

RenderOptions parse_render_options(int argc, const char *const argv[]) {
	RenderOptions options;

	for (int i = 1; i < argc; ++i) {
		std::string flag = argv[i];
		if (flag == "--help" || flag == "-h") {
			options.help = true;
			continue;
		}

		if (i + 1 >= argc) {
			throw std::invalid_argument("Missing value for " + flag);
		}
		std::string value = argv[++i];

		if (flag == "--width") {
			options.width = parse_positive_int(flag, value);
		} else if (flag == "--height") {
			options.height = parse_positive_int(flag, value);
		} else if (flag == "--fov") {
			options.fov = parse_double(flag, value);
			if (!(options.fov > 0.0 && options.fov < PI)) {
				throw std::invalid_argument("--fov must be in (0, pi): " + value);
			}
		} else if (flag == "--output") {
			options.output = value;
		} else if (flag == "--assets") {
			options.assets = value;
		} else if (flag == "--yaw") {
			options.yaw = parse_double(flag, value);
		} else if (flag == "--pitch") {
			options.pitch = parse_double(flag, value);
		} else if (flag == "--zoom") {
			options.zoom = parse_double(flag, value);
		} else if (flag == "--frames") {
			options.frames = parse_positive_int(flag, value);
		} else {
			throw std::invalid_argument("Unknown option: " + flag);
		}
	}

	return options;
}

std::string render_usage(const std::string &program) {
	return "Usage: " + program + " [options]\n"
		"  --width N      image width (default 1300)\n"
		"  --height N     image height (default 900)\n"
		"  --fov RAD      vertical field of view (default pi/3)\n"
		"  --output FILE  output .ppm path (default render.ppm)\n"
		"  --assets DIR   texture directory (default assets)\n"
		"  --yaw RAD      camera orbit per frame around the vertical axis\n"
		"  --pitch RAD    camera orbit per frame up/down\n"
		"  --zoom D       camera move towards the target per frame\n"
		"  --frames N     number of frames to render (default 1)\n";
}

std::string frame_path(const std::string &output, int frame, int frames) {
	if (frames <= 1) {
		return output;
	}

	std::string stem = output;
	const std::string ext = ".ppm";
	if (stem.size() >= ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0) {
		stem.erase(stem.size() - ext.size());
	}

	char suffix[16];
	std::snprintf(suffix, sizeof(suffix), "_%03d", frame);
	return stem + suffix + ext;
}

}
