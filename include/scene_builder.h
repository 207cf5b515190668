#ifndef PRT_INCLUDE_SCENE_BUILDER_H
#define PRT_INCLUDE_SCENE_BUILDER_H

#include <camera.h>
#include <scene.h>
#include <string>
#include <texture_manager.h>
#include <vector>

namespace prt {

// Texture ids the floating island scene can use, each loaded from <id>.ppm.
const std::vector<std::string> &floating_island_texture_ids();

// Id of the optional panorama used as environment map.
extern const char *const SKYBOX_TEXTURE_ID;

// A small block island with a tree, glass and water blocks and an emissive
// light block. Materials only reference textures registered in the manager.
Scene build_floating_island_scene(const TextureManager &textures);

// Camera the island scene is viewed from.
Camera floating_island_camera();

}

#endif
