#ifndef PRT_INCLUDE_OBJECT_OBJECT_H
#define PRT_INCLUDE_OBJECT_OBJECT_H

#include <basic/ray.h>
#include <object/cube.h>
#include <object/intersect.h>
#include <object/sphere.h>
#include <variant>

namespace prt {

// Every kind of object a scene can hold. The set is closed, adding a kind
// means adding it here and to intersect_ray.
using Object = std::variant<Sphere, Cube>;

// Function to check ray-object intersection.
Intersect intersect_ray(const Object &object, const Ray &ray);

}

#endif
