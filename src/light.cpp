#include <light.h>
#include <stdexcept>

namespace prt {

Light::Light(const Point3 &position, const Rgb8 &color, double intensity)
	: position(position), color(color), intensity(intensity) {
	if (intensity < 0.0) {
		throw std::invalid_argument("Light intensity cannot be negative");
	}
}

Color3 Light::color3() const {
	return Color3(color.r / 255.0, color.g / 255.0, color.b / 255.0);
}

}
