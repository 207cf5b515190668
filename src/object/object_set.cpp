#include <limits>
#include <object/object_set.h>
#include <utility>

namespace prt {

void ObjectSet::add(Object object) {
	objects.push_back(std::move(object));
}

bool ObjectSet::empty() const {
	return objects.empty();
}

std::size_t ObjectSet::size() const {
	return objects.size();
}

Intersect ObjectSet::nearest_hit(const Ray &ray) const {
	Intersect nearest = Intersect::empty();
	double zbuffer = std::numeric_limits<double>::infinity();

	for (const Object &object : objects) {
		Intersect hit = intersect_ray(object, ray);
		if (hit.is_intersecting && hit.distance < zbuffer) {
			zbuffer = hit.distance;
			nearest = std::move(hit);
		}
	}

	return nearest;
}

bool ObjectSet::occluded(const Ray &ray, double max_distance) const {
	for (const Object &object : objects) {
		Intersect hit = intersect_ray(object, ray);
		if (hit.is_intersecting && hit.distance < max_distance) {
			return true;
		}
	}
	return false;
}

}
