#ifndef PRT_INCLUDE_OBJECT_CUBE_H
#define PRT_INCLUDE_OBJECT_CUBE_H

#include <basic/ray.h>
#include <basic/vec3.h>
#include <material/material.h>
#include <object/intersect.h>
#include <utility>

namespace prt {

// Axis aligned cube with the same edge length on every axis.
class Cube {
public:
	// Constructor to initialize a Cube object.
	Cube() = delete;
	Cube(const Point3 &center, double size, MaterialPtr material);

	// Function to check ray-cube intersection (slab test). A ray starting
	// inside the cube hits the face it leaves through.
	Intersect intersect_ray(const Ray &ray) const;

	// Outward face normal for a point on the surface.
	Vec3 face_normal(const Point3 &point) const;

	// Face coordinates for a point on the surface, clamped to [0, 1].
	std::pair<double, double> uv(const Point3 &point, const Vec3 &normal) const;

	const Point3 &center() const;
	double size() const;
	double half_extent() const;
	const MaterialPtr &material() const;

private:
	Point3 center_;
	double size_; // Edge length
	MaterialPtr material_;
};

}

#endif
