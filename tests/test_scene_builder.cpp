#include "test_util.h"
#include <basic/math.h>
#include <render/renderer.h>
#include <scene_builder.h>
#include <variant>

using namespace prt;
using prt::test::check_vec3;

TEST_CASE("Floating island without textures", "[scene]") {
	TextureManager textures;
	Scene scene = build_floating_island_scene(textures);

	CHECK(scene.objects.size() == 32);
	CHECK_FALSE(scene.environment_map.has_value());
	CHECK(scene.light.intensity == Approx(1.5));
	check_vec3(scene.light.position, Point3(1.0, -1.0, 5.0), 0.0);

	for (const Object &object : scene.objects.objects) {
		REQUIRE(std::holds_alternative<Cube>(object));
		CHECK_FALSE(std::get<Cube>(object).material()->texture_id.has_value());
	}

	/// Blocks of the same kind share one material.
	CHECK(std::get<Cube>(scene.objects.objects[0]).material() == std::get<Cube>(scene.objects.objects[1]).material());

	/// The sun block is small and glows.
	const Cube &sun = std::get<Cube>(scene.objects.objects.back());
	CHECK(sun.size() == Approx(0.5));
	check_vec3(sun.material()->emissive, Color3(2.0, 2.0, 2.0), 0.0);
}

TEST_CASE("Floating island picks up registered textures", "[scene]") {
	TextureManager textures;
	textures.add_texture("wood", Texture(2, 2, Color3(0.5, 0.3, 0.1)));
	textures.add_texture(SKYBOX_TEXTURE_ID, Texture(4, 2, Color3(0.2, 0.4, 0.9)));

	Scene scene = build_floating_island_scene(textures);
	REQUIRE(scene.environment_map.has_value());
	CHECK(*scene.environment_map == SKYBOX_TEXTURE_ID);

	/// First trunk block follows the 15 dirt blocks.
	const Cube &trunk = std::get<Cube>(scene.objects.objects[15]);
	CHECK(trunk.material()->texture_id == std::optional<std::string>("wood"));
	CHECK_FALSE(std::get<Cube>(scene.objects.objects[0]).material()->texture_id.has_value());
}

TEST_CASE("Floating island renders", "[scene][renderer]") {
	TextureManager textures;
	Scene scene = build_floating_island_scene(textures);
	Camera camera = floating_island_camera();
	check_vec3(camera.eye(), Point3(0.0, 2.0, 8.0), 0.0);

	camera.orbit(0.3, 0.1);
	camera.zoom(1.0);

	Texture frame(16, 12, Color3());
	render(frame, scene, camera, textures, PI / 3.0);

	for (int y = 0; y < frame.height(); ++y) {
		for (int x = 0; x < frame.width(); ++x) {
			CHECK(frame.pixel(x, y).is_finite());
		}
	}
}
