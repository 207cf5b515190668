#include <algorithm>
#include <basic/math.h>
#include <camera.h>
#include <cmath>
#include <stdexcept>

namespace prt {

Camera::Camera(const Point3 &eye, const Point3 &target, const Vec3 &up)
	: eye_(eye), target_(target), world_up_(up) {
	if ((target_ - eye_).near_zero()) {
		throw std::invalid_argument("Camera eye and target cannot coincide");
	}
	if ((target_ - eye_).cross(world_up_).near_zero()) {
		throw std::invalid_argument("Camera up vector cannot be parallel to the view direction");
	}
	update_basis();
}

Vec3 Camera::basis_change(const Vec3 &direction) const {
	return direction.x() * right_ + direction.y() * up_ - direction.z() * forward_;
}

void Camera::orbit(double delta_yaw, double delta_pitch) {
	// Spherical frame with world up as the pole. For +Y up this is X, Y, Z.
	Vec3 pole = world_up_.normalized();
	Vec3 reference = std::fabs(pole.x()) < 0.9 ? Vec3(1.0, 0.0, 0.0) : Vec3(0.0, 0.0, 1.0);
	Vec3 axis_x = (reference - pole * reference.dot(pole)).normalized();
	Vec3 axis_z = axis_x.cross(pole);

	Vec3 radius_vector = eye_ - target_;
	double radius = radius_vector.length();
	double along_x = radius_vector.dot(axis_x);
	double along_z = radius_vector.dot(axis_z);

	double yaw = std::atan2(along_z, along_x);
	double pitch = std::atan2(radius_vector.dot(pole), std::sqrt(along_x * along_x + along_z * along_z));

	yaw = std::fmod(yaw + delta_yaw, 2.0 * PI);
	pitch = std::clamp(pitch + delta_pitch, -PI / 2.0 + PITCH_MARGIN, PI / 2.0 - PITCH_MARGIN);

	eye_ = target_ + radius * (std::cos(yaw) * std::cos(pitch) * axis_x
							   + std::sin(pitch) * pole
							   + std::sin(yaw) * std::cos(pitch) * axis_z);

	update_basis();
}

void Camera::zoom(double delta) {
	Vec3 to_target = target_ - eye_;
	double distance = std::max(to_target.length() - delta, MIN_ZOOM_DISTANCE);

	eye_ = target_ - to_target.normalized() * distance;

	update_basis();
}

const Point3 &Camera::eye() const {
	return eye_;
}

const Point3 &Camera::target() const {
	return target_;
}

const Vec3 &Camera::forward() const {
	return forward_;
}

const Vec3 &Camera::right() const {
	return right_;
}

const Vec3 &Camera::up() const {
	return up_;
}

void Camera::update_basis() {
	forward_ = (target_ - eye_).normalized();
	right_ = forward_.cross(world_up_).normalized();
	up_ = right_.cross(forward_);
}

}
