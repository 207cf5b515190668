#include <material/material.h>
#include <stdexcept>
#include <utility>

namespace prt {

Material::Material(const Color3 &diffuse,
	double specular,
	const std::array<double, 4> &albedo,
	double refractive_index,
	std::optional<std::string> texture_id,
	std::optional<std::string> normal_map_id,
	const Color3 &emissive)
	: diffuse(diffuse)
	, specular(specular)
	, albedo(albedo)
	, refractive_index(refractive_index)
	, texture_id(std::move(texture_id))
	, normal_map_id(std::move(normal_map_id))
	, emissive(emissive) {

	if (specular < 0.0) {
		throw std::invalid_argument("Specular exponent cannot be negative");
	}

	// A transparent surface has to bend light through a real medium.
	if (albedo[ALBEDO_REFRACT] > 0.0 && refractive_index <= 0.0) {
		throw std::invalid_argument("Transparent material needs a positive refractive index");
	}
}

double Material::reflectivity() const {
	return albedo[ALBEDO_REFLECT];
}

double Material::transparency() const {
	return albedo[ALBEDO_REFRACT];
}

}
