#ifndef PRT_INCLUDE_TEXTURE_LOOKUP_H
#define PRT_INCLUDE_TEXTURE_LOOKUP_H

#include <basic/vec3.h>
#include <string>

namespace prt {

// Read access to named images, the only way the tracer reaches texture data.
// Pixel coordinates come from uv * dimension truncated to an integer.
class TextureLookup {
protected:
	TextureLookup() = default;

public:
	TextureLookup(const TextureLookup &) = delete;
	TextureLookup &operator=(const TextureLookup &) = delete;

	// Destructor
	virtual ~TextureLookup();

	virtual int width(const std::string &id) const = 0;
	virtual int height(const std::string &id) const = 0;

	// Color in [0, 1].
	virtual Color3 get_pixel_color(const std::string &id, int x, int y) const = 0;

	// Tangent space normal, components in [-1, 1].
	virtual Vec3 get_normal_from_map(const std::string &id, int x, int y) const = 0;
};

}

#endif
