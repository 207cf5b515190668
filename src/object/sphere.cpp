#include <algorithm>
#include <basic/math.h>
#include <cmath>
#include <object/sphere.h>
#include <stdexcept>

namespace prt {

Sphere::Sphere(const Point3 &center, double radius, MaterialPtr material)
	: center_(center), radius_(radius), material_(std::move(material)) {
	if (material_ == nullptr) {
		throw std::invalid_argument("Material pointer cannot be null");
	}
	if (!(radius_ > 0.0)) {
		throw std::invalid_argument("Sphere radius must be positive");
	}
}

Intersect Sphere::intersect_ray(const Ray &ray) const {
	// Solve |Q + tD - C|^2 = r^2 for t.
	Vec3 oc = ray.Q - center_;
	double a = ray.D.dot(ray.D);
	double b = 2.0 * oc.dot(ray.D);
	double c = oc.dot(oc) - radius_ * radius_;

	double discriminant = b * b - 4.0 * a * c;
	if (discriminant <= 0.0) {
		return Intersect::empty();
	}

	// Only the near root is used, a ray starting inside the sphere misses it.
	double t = (-b - std::sqrt(discriminant)) / (2.0 * a);
	if (t <= 0.0) {
		return Intersect::empty();
	}

	Point3 point = ray.Q + ray.D * t;
	Vec3 normal = (point - center_).normalized();
	auto [u, v] = uv(point);

	return Intersect(point, normal, t, material_, u, v);
}

std::pair<double, double> Sphere::uv(const Point3 &point) const {
	Vec3 n = (point - center_) / radius_;
	double u = 0.5 + std::atan2(n.x(), n.z()) / (2.0 * PI);
	double v = 0.5 - std::asin(std::clamp(n.y(), -1.0, 1.0)) / PI;
	return { u, v };
}

const Point3 &Sphere::center() const {
	return center_;
}

double Sphere::radius() const {
	return radius_;
}

const MaterialPtr &Sphere::material() const {
	return material_;
}

}
