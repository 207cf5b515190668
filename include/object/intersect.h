#ifndef PRT_INCLUDE_OBJECT_INTERSECT_H
#define PRT_INCLUDE_OBJECT_INTERSECT_H

#include <basic/vec3.h>
#include <material/material.h>

namespace prt {

// Result of testing one ray against one object.
struct Intersect {
	bool is_intersecting = false;
	Point3 point;
	Vec3 normal; // Unit length, pointing out of the object
	double distance = 0.0; // Ray parameter t, always > 0 for a hit
	MaterialPtr material;
	double u = 0.0, v = 0.0; // Surface coordinates in [0, 1]

	Intersect() = default;
	Intersect(const Point3 &point, const Vec3 &normal, double distance, MaterialPtr material, double u, double v);

	// The "no hit" value.
	static Intersect empty();
};

}

#endif
