#ifndef PRT_INCLUDE_RENDER_TRACER_H
#define PRT_INCLUDE_RENDER_TRACER_H

#include <basic/ray.h>
#include <basic/vec3.h>
#include <object/intersect.h>
#include <optional>
#include <scene.h>
#include <string>
#include <texture_lookup.h>
#include <utility>

namespace prt {

// Color of a ray leaving the scene: the environment map when the scene names
// one, a procedural sky gradient otherwise.
Color3 skybox_color(const Vec3 &direction, const Scene &scene, const TextureLookup &textures);

// The procedural sky alone, a pure function of the direction.
Color3 procedural_sky(const Vec3 &direction);

// Hit point pushed ORIGIN_BIAS along the normal, to the side the new ray travels to.
Point3 offset_origin(const Intersect &intersect, const Vec3 &direction);

// Normal used for lighting: the geometric normal perturbed by the material's
// normal map if it has one.
Vec3 shading_normal(const Intersect &intersect, const TextureLookup &textures);

// Tangent frame around a unit normal as (tangent, bitangent).
std::pair<Vec3, Vec3> tangent_frame(const Vec3 &normal);

// 1.0 if something sits between the hit point and the light, 0.0 otherwise.
double cast_shadow(const Intersect &intersect, const Light &light, const ObjectSet &objects);

// Trace one ray and return its color. depth counts the bounces so far,
// recursion stops past MAX_DEPTH.
Color3 cast_ray(const Ray &ray, const Scene &scene, const TextureLookup &textures, int depth = 0);

// Sample a named texture at normalized coordinates.
Color3 sample_texture(const TextureLookup &textures, const std::string &id, double u, double v);

}

#endif
