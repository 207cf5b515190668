/*
 * Renders the floating island scene to PPM files.
 * Textures are read from <assets>/<id>.ppm when present, blocks without one
 * use their flat material color.
 */

#include <config.h>
#include <exception>
#include <fstream>
#include <iostream>
#include <render/renderer.h>
#include <scene_builder.h>
#include <stdexcept>
#include <texture.h>
#include <texture_manager.h>

namespace {

void load_scene_textures(prt::TextureManager &textures, const std::string &assets) {
	std::vector<std::string> ids = prt::floating_island_texture_ids();
	ids.push_back(prt::SKYBOX_TEXTURE_ID);

	for (const std::string &id : ids) {
		std::string path = assets + "/" + id + ".ppm";
		if (!std::ifstream(path)) {
			std::cerr << "Texture " << path << " not found, using flat color." << std::endl;
			continue;
		}
		try {
			textures.load_texture(id, path);
		} catch (const std::runtime_error &e) {
			std::cerr << "Skipping texture " << id << ": " << e.what() << std::endl;
		}
	}
}

}

int main(int argc, char *argv[]) {
	try {
		prt::RenderOptions options = prt::parse_render_options(argc, argv);
		if (options.help) {
			std::cout << prt::render_usage(argv[0]);
			return 0;
		}

		prt::TextureManager textures;
		std::cout << "Loading textures..." << std::endl;
		load_scene_textures(textures, options.assets);

		prt::Scene scene = prt::build_floating_island_scene(textures);
		prt::Camera camera = prt::floating_island_camera();
		prt::Texture framebuffer(options.width, options.height, prt::Color3());

		for (int frame = 0; frame < options.frames; ++frame) {
			if (options.yaw != 0.0 || options.pitch != 0.0) {
				camera.orbit(options.yaw, options.pitch);
			}
			if (options.zoom != 0.0) {
				camera.zoom(options.zoom);
			}

			std::cout << "Rendering frame " << frame + 1 << "/" << options.frames << "..." << std::endl;
			prt::render(framebuffer, scene, camera, textures, options.fov);

			std::string path = prt::frame_path(options.output, frame, options.frames);
			if (!framebuffer.save_texture(path)) {
				std::cerr << "Error: failed to write " << path << std::endl;
				return 1;
			}
			std::cout << "Finished render. Output: " << path << std::endl;
		}
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
