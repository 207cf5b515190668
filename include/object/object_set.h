#ifndef PRT_INCLUDE_OBJECT_OBJECT_SET_H
#define PRT_INCLUDE_OBJECT_OBJECT_SET_H

#include <basic/ray.h>
#include <object/intersect.h>
#include <object/object.h>
#include <vector>

namespace prt {

// Unified container for all objects, scanned linearly in insertion order.
struct ObjectSet {
	std::vector<Object> objects;

	void add(Object object);
	bool empty() const;
	std::size_t size() const;

	// Closest hit along the ray, ties go to the object added first.
	Intersect nearest_hit(const Ray &ray) const;

	// True if any object is hit strictly closer than max_distance.
	bool occluded(const Ray &ray, double max_distance) const;
};

}

#endif
