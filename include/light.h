#ifndef PRT_INCLUDE_LIGHT_H
#define PRT_INCLUDE_LIGHT_H

#include <basic/vec3.h>
#include <cstdint>

namespace prt {

// 8-bit per channel color.
struct Rgb8 {
	std::uint8_t r = 0, g = 0, b = 0;
};

// Point light.
struct Light {
	Point3 position;
	Rgb8 color;
	double intensity = 1.0; // Scalar multiplier, >= 0

	Light() = default;
	Light(const Point3 &position, const Rgb8 &color, double intensity);

	// Light color scaled to [0, 1].
	Color3 color3() const;
};

}

#endif
