#include <initializer_list>
#include <optional>
#include <scene_builder.h>

namespace prt {

const char *const SKYBOX_TEXTURE_ID = "skybox";

namespace {

std::optional<std::string> registered(const TextureManager &textures, const std::string &id) {
	if (textures.has_texture(id)) {
		return id;
	}
	return std::nullopt;
}

void add_block(Scene &scene, double x, double y, double z, const MaterialPtr &material, double size = 1.0) {
	scene.objects.add(Cube(Point3(x, y, z), size, material));
}

}

const std::vector<std::string> &floating_island_texture_ids() {
	static const std::vector<std::string> ids = { "wood", "leaves", "water", "stone", "dirt", "glass" };
	return ids;
}

Scene build_floating_island_scene(const TextureManager &textures) {
	MaterialPtr wood = make_material(Color3(0.6, 0.4, 0.2), 5.0, std::array<double, 4> { 0.8, 0.1, 0.0, 0.0 }, 0.0,
		registered(textures, "wood"));
	MaterialPtr leaves = make_material(Color3(0.2, 0.6, 0.2), 3.0, std::array<double, 4> { 0.9, 0.05, 0.0, 0.0 }, 0.0,
		registered(textures, "leaves"));
	MaterialPtr water = make_material(Color3(0.2, 0.4, 0.8), 50.0, std::array<double, 4> { 0.2, 0.1, 0.7, 0.0 }, 0.0,
		registered(textures, "water"));
	MaterialPtr stone = make_material(Color3(0.5, 0.5, 0.5), 10.0, std::array<double, 4> { 0.9, 0.05, 0.0, 0.0 }, 0.0,
		registered(textures, "stone"));
	MaterialPtr dirt = make_material(Color3(0.4, 0.3, 0.2), 2.0, std::array<double, 4> { 0.9, 0.05, 0.0, 0.0 }, 0.0,
		registered(textures, "dirt"));
	MaterialPtr glass = make_material(Color3(0.6, 0.7, 0.8), 125.0, std::array<double, 4> { 0.0, 0.1, 0.1, 0.8 }, 1.5,
		registered(textures, "glass"));
	MaterialPtr glow = make_material(Color3(1.0, 1.0, 1.0), 10.0, std::array<double, 4> { 1.0, 0.0, 0.0, 0.0 }, 0.0,
		std::nullopt, std::nullopt, Color3(2.0, 2.0, 2.0));

	Scene scene;

	// Island: three layers of dirt in a plus shape
	for (double y : { -1.5, -0.5, 0.5 }) {
		add_block(scene, 0.0, y, 0.0, dirt);
		add_block(scene, 1.0, y, 0.0, dirt);
		add_block(scene, -1.0, y, 0.0, dirt);
		add_block(scene, 0.0, y, 1.0, dirt);
		add_block(scene, 0.0, y, -1.0, dirt);
	}

	// Tree trunk and crown
	add_block(scene, 0.0, 1.5, 0.0, wood);
	add_block(scene, 0.0, 2.5, 0.0, wood);
	add_block(scene, 0.0, 3.5, 0.0, leaves);
	add_block(scene, 1.0, 3.5, 0.0, leaves);
	add_block(scene, -1.0, 3.5, 0.0, leaves);
	add_block(scene, 0.0, 3.5, 1.0, leaves);
	add_block(scene, 0.0, 3.5, -1.0, leaves);
	add_block(scene, 0.0, 4.5, 0.0, leaves);

	// Chest
	add_block(scene, 1.5, 1.0, 1.5, wood);

	// Stone pillar
	add_block(scene, -1.5, 1.0, -1.5, stone);
	add_block(scene, -1.5, 2.0, -1.5, stone);

	// Glass
	add_block(scene, 2.0, 1.0, -1.0, glass);
	add_block(scene, 2.0, 2.0, -1.0, glass);
	add_block(scene, 2.0, 1.0, 0.0, glass);

	// Water
	add_block(scene, -2.0, 1.0, 1.0, water);
	add_block(scene, -2.0, 1.0, 0.0, water);

	// Sun
	add_block(scene, 0.0, 6.0, 0.0, glow, 0.5);

	scene.light = Light(Point3(1.0, -1.0, 5.0), Rgb8 { 255, 255, 255 }, 1.5);
	scene.environment_map = registered(textures, SKYBOX_TEXTURE_ID);

	return scene;
}

Camera floating_island_camera() {
	return Camera(Point3(0.0, 2.0, 8.0), Point3(0.0, 1.0, 0.0), Vec3(0.0, 1.0, 0.0));
}

}
