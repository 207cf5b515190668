#include <object/object.h>

namespace prt {

Intersect intersect_ray(const Object &object, const Ray &ray) {
	return std::visit([&ray](const auto &o) { return o.intersect_ray(ray); }, object);
}

}
