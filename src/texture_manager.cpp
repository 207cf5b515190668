#include <algorithm>
#include <stdexcept>
#include <texture_manager.h>
#include <utility>

namespace prt {

void TextureManager::load_texture(const std::string &id, const std::string &path) {
	add_texture(id, Texture(path));
}

void TextureManager::add_texture(const std::string &id, Texture texture) {
	if (texture.width() <= 0 || texture.height() <= 0) {
		throw std::invalid_argument("Cannot register an empty texture: " + id);
	}
	textures_[id] = std::move(texture);
}

bool TextureManager::has_texture(const std::string &id) const {
	return textures_.count(id) != 0;
}

const Texture &TextureManager::get_texture(const std::string &id) const {
	auto it = textures_.find(id);
	if (it == textures_.end()) {
		throw std::out_of_range("Texture not registered: " + id);
	}
	return it->second;
}

int TextureManager::width(const std::string &id) const {
	return get_texture(id).width();
}

int TextureManager::height(const std::string &id) const {
	return get_texture(id).height();
}

Color3 TextureManager::get_pixel_color(const std::string &id, int x, int y) const {
	return clamped_pixel(id, x, y);
}

Vec3 TextureManager::get_normal_from_map(const std::string &id, int x, int y) const {
	// Normal maps store each component remapped from [-1, 1] to [0, 1].
	const Color3 &c = clamped_pixel(id, x, y);
	return Vec3(c.x() * 2.0 - 1.0, c.y() * 2.0 - 1.0, c.z() * 2.0 - 1.0);
}

const Color3 &TextureManager::clamped_pixel(const std::string &id, int x, int y) const {
	const Texture &texture = get_texture(id);
	return texture.pixel(std::clamp(x, 0, texture.width() - 1), std::clamp(y, 0, texture.height() - 1));
}

}
