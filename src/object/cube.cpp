#include <algorithm>
#include <cmath>
#include <object/cube.h>
#include <stdexcept>

namespace prt {

namespace {

// +1 or -1 with the sign of v, zero counts as positive.
double signum(double v) {
	return std::copysign(1.0, v);
}

}

Cube::Cube(const Point3 &center, double size, MaterialPtr material)
	: center_(center), size_(size), material_(std::move(material)) {
	if (material_ == nullptr) {
		throw std::invalid_argument("Material pointer cannot be null");
	}
	if (!(size_ > 0.0)) {
		throw std::invalid_argument("Cube size must be positive");
	}
}

Intersect Cube::intersect_ray(const Ray &ray) const {
	double half = half_extent();
	Point3 box_min = center_ - Vec3(half, half, half);
	Point3 box_max = center_ + Vec3(half, half, half);

	// A zero direction component gives infinite slab bounds, which the
	// min/max below handle without a special case.
	double t_enter = -INFINITY;
	double t_exit = INFINITY;
	for (int axis = 0; axis < 3; ++axis) {
		double t0 = (box_min[axis] - ray.Q[axis]) / ray.D[axis];
		double t1 = (box_max[axis] - ray.Q[axis]) / ray.D[axis];
		if (t0 > t1) {
			std::swap(t0, t1);
		}
		t_enter = std::fmax(t_enter, t0);
		t_exit = std::fmin(t_exit, t1);
	}

	if (!(t_enter < t_exit && t_exit > 0.0)) {
		return Intersect::empty();
	}

	double t = t_enter > 0.0 ? t_enter : t_exit;
	Point3 point = ray.Q + ray.D * t;
	Vec3 normal = face_normal(point);
	auto [u, v] = uv(point, normal);

	return Intersect(point, normal, t, material_, u, v);
}

Vec3 Cube::face_normal(const Point3 &point) const {
	Vec3 local = point - center_;
	Vec3 a = local.abs();

	// Axis priority x, y, z. Rendered output depends on this exact order.
	if (a.x() > a.y() && a.x() > a.z()) {
		return Vec3(signum(local.x()), 0.0, 0.0);
	} else if (a.y() > a.z()) {
		return Vec3(0.0, signum(local.y()), 0.0);
	}
	return Vec3(0.0, 0.0, signum(local.z()));
}

std::pair<double, double> Cube::uv(const Point3 &point, const Vec3 &normal) const {
	double half = half_extent();
	Vec3 local = point - center_;
	Vec3 n = normal.abs();

	auto to_face = [&](double a, double b) -> std::pair<double, double> {
		return {
			std::clamp((a + half) / size_, 0.0, 1.0),
			std::clamp((b + half) / size_, 0.0, 1.0)
		};
	};

	if (n.x() > n.y() && n.x() > n.z()) {
		return to_face(local.z(), local.y());
	} else if (n.y() > n.z()) {
		return to_face(local.x(), local.z());
	}
	return to_face(local.x(), local.y());
}

const Point3 &Cube::center() const {
	return center_;
}

double Cube::size() const {
	return size_;
}

double Cube::half_extent() const {
	return size_ * 0.5;
}

const MaterialPtr &Cube::material() const {
	return material_;
}

}
