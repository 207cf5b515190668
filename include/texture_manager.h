#ifndef PRT_INCLUDE_TEXTURE_MANAGER_H
#define PRT_INCLUDE_TEXTURE_MANAGER_H

#include <string>
#include <texture.h>
#include <texture_lookup.h>
#include <unordered_map>

namespace prt {

// In-memory texture registry keyed by id. Lookups of an unknown id throw
// std::out_of_range, coordinates past the edge clamp to the border pixel.
class TextureManager : public TextureLookup {
public:
	TextureManager() = default;
	~TextureManager() override = default;

	// Load a PPM file and register it under id, replacing any previous entry.
	void load_texture(const std::string &id, const std::string &path);

	// Register an already built texture. Throws std::invalid_argument if it has no pixels.
	void add_texture(const std::string &id, Texture texture);

	bool has_texture(const std::string &id) const;
	const Texture &get_texture(const std::string &id) const;

	int width(const std::string &id) const override;
	int height(const std::string &id) const override;
	Color3 get_pixel_color(const std::string &id, int x, int y) const override;
	Vec3 get_normal_from_map(const std::string &id, int x, int y) const override;

private:
	const Color3 &clamped_pixel(const std::string &id, int x, int y) const;

	std::unordered_map<std::string, Texture> textures_;
};

}

#endif
