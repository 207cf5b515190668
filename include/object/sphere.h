#ifndef PRT_INCLUDE_OBJECT_SPHERE_H
#define PRT_INCLUDE_OBJECT_SPHERE_H

#include <basic/ray.h>
#include <basic/vec3.h>
#include <material/material.h>
#include <object/intersect.h>
#include <utility>

namespace prt {

class Sphere {
public:
	// Constructor to initialize a Sphere object.
	Sphere() = delete;
	Sphere(const Point3 &center, double radius, MaterialPtr material);

	// Function to check ray-sphere intersection. Only hits in front of the
	// ray origin count.
	Intersect intersect_ray(const Ray &ray) const;

	// Equirectangular coordinates of a point on the surface, v = 0 at the top pole.
	std::pair<double, double> uv(const Point3 &point) const;

	const Point3 &center() const;
	double radius() const;
	const MaterialPtr &material() const;

private:
	Point3 center_;
	double radius_;
	MaterialPtr material_;
};

}

#endif
