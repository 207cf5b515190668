#ifndef PRT_INCLUDE_MATERIAL_MATERIAL_H
#define PRT_INCLUDE_MATERIAL_MATERIAL_H

#include <array>
#include <basic/vec3.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace prt {

// Albedo slots: how much of each contribution ends up in the final color.
enum AlbedoIndex {
	ALBEDO_DIFFUSE = 0,
	ALBEDO_SPECULAR = 1,
	ALBEDO_REFLECT = 2,
	ALBEDO_REFRACT = 3,
};

// Surface description shared by every object that uses it. Immutable once built.
class Material {
public:
	// Constructors
	Material() = delete;
	Material(const Color3 &diffuse,
		double specular,
		const std::array<double, 4> &albedo,
		double refractive_index,
		std::optional<std::string> texture_id = std::nullopt,
		std::optional<std::string> normal_map_id = std::nullopt,
		const Color3 &emissive = Color3());

	// Destructor
	~Material() = default;

	double reflectivity() const;
	double transparency() const;

	const Color3 diffuse; // Flat surface color, used when there is no texture
	const double specular; // Phong exponent
	const std::array<double, 4> albedo; // [diffuse, specular, reflectivity, transparency]
	const double refractive_index; // Only meaningful when transparency > 0
	const std::optional<std::string> texture_id;
	const std::optional<std::string> normal_map_id;
	const Color3 emissive; // Added to the local color as self illumination
};

using MaterialPtr = std::shared_ptr<const Material>;

// Build a shared material.
template <typename... Args>
MaterialPtr make_material(Args &&...args) {
	return std::make_shared<const Material>(std::forward<Args>(args)...);
}

}

#endif
