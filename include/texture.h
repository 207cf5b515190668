#ifndef PRT_INCLUDE_TEXTURE_H
#define PRT_INCLUDE_TEXTURE_H

#include <basic/vec3.h>
#include <cstddef>
#include <light.h>
#include <string>
#include <vector>

namespace prt {

class Texture {
public:
	// Constructors
	Texture() = default; // Allow default constructor.
	explicit Texture(const std::string &image_path); // Initialize the image by loading from file (currently support .ppm format).
	Texture(int width, int height, const Color3 &fill_color); // Initialize the image by filling with a color.

	// Pixel access, throws std::out_of_range outside the image.
	Color3 &pixel(int x, int y);
	const Color3 &pixel(int x, int y) const;

	// Save the texture to a file (currently support .ppm format)
	bool save_texture(const std::string &file_path) const;

	int width() const;
	int height() const;

private:
	// Row-major index of (x, y), throws std::out_of_range outside the image.
	std::size_t index_of(int x, int y) const;

	int width_ = 0, height_ = 0; // The image width and height.

	// The raw pixel data, stored row by row: index y * width_ + x.
	std::vector<Color3> image_;
};

// Clamp each channel to [0, 1] and scale it to 0..255 for display.
Rgb8 to_rgb8(const Color3 &color);

}

#endif
