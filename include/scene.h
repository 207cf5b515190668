#ifndef PRT_INCLUDE_SCENE_H
#define PRT_INCLUDE_SCENE_H

#include <light.h>
#include <object/object_set.h>
#include <optional>
#include <string>

namespace prt {

// Everything a render pass reads besides the camera. Read only while tracing.
struct Scene {
	ObjectSet objects;
	Light light;
	std::optional<std::string> environment_map; // Panorama id, procedural sky when unset
};

}

#endif
