#include <algorithm>
#include <basic/vec3.h>
#include <utility>

namespace prt {

// Default constructor - creates zero vector
Vec3::Vec3()
	: e_ { 0, 0, 0 } {
}

// Parameterized constructor
Vec3::Vec3(double e0, double e1, double e2)
	: e_ { e0, e1, e2 } {
}

double Vec3::x() const {
	return e_[0];
}

double Vec3::y() const {
	return e_[1];
}

double Vec3::z() const {
	return e_[2];
}

Vec3 Vec3::operator-() const {
	return Vec3(-e_[0], -e_[1], -e_[2]);
}

double Vec3::operator[](int i) const {
	return e_[i];
}

double &Vec3::operator[](int i) {
	return e_[i];
}

// Compound division assignment - returns invalid vector (NaN) if division by zero
Vec3 &Vec3::operator/=(double t) {
	if (t == 0.0) {
		e_[0] = e_[1] = e_[2] = NAN;
		return *this;
	}
	e_[0] /= t;
	e_[1] /= t;
	e_[2] /= t;
	return *this;
}

double Vec3::length() const {
	return std::sqrt(length_squared());
}

double Vec3::length_squared() const {
	return e_[0] * e_[0] + e_[1] * e_[1] + e_[2] * e_[2];
}

// Normalize this vector - returns invalid vector (NaN) if length is zero
Vec3 &Vec3::normalize() {
	*this /= length();
	return *this;
}

Vec3 Vec3::normalized() const {
	return *this / length();
}

double Vec3::dot(const Vec3 &v) const {
	return e_[0] * v.e_[0] + e_[1] * v.e_[1] + e_[2] * v.e_[2];
}

Vec3 Vec3::cross(const Vec3 &v) const {
	return Vec3(e_[1] * v.e_[2] - e_[2] * v.e_[1], e_[2] * v.e_[0] - e_[0] * v.e_[2],
		e_[0] * v.e_[1] - e_[1] * v.e_[0]);
}

Vec3 Vec3::abs() const {
	return Vec3(std::fabs(e_[0]), std::fabs(e_[1]), std::fabs(e_[2]));
}

// Check if vector is near zero (for floating point precision)
bool Vec3::near_zero() const {
	const auto s = 1e-8;
	return (std::fabs(e_[0]) < s) && (std::fabs(e_[1]) < s) && (std::fabs(e_[2]) < s);
}

bool Vec3::is_finite() const {
	return std::isfinite(e_[0]) && std::isfinite(e_[1]) && std::isfinite(e_[2]);
}

Vec3 operator+(const Vec3 &u, const Vec3 &v) {
	return Vec3(u.e_[0] + v.e_[0], u.e_[1] + v.e_[1], u.e_[2] + v.e_[2]);
}

Vec3 operator-(const Vec3 &u, const Vec3 &v) {
	return Vec3(u.e_[0] - v.e_[0], u.e_[1] - v.e_[1], u.e_[2] - v.e_[2]);
}

// Component-wise multiplication
Vec3 operator*(const Vec3 &u, const Vec3 &v) {
	return Vec3(u.e_[0] * v.e_[0], u.e_[1] * v.e_[1], u.e_[2] * v.e_[2]);
}

Vec3 operator*(double t, const Vec3 &v) {
	return Vec3(t * v.e_[0], t * v.e_[1], t * v.e_[2]);
}

Vec3 operator*(const Vec3 &v, double t) {
	return t * v;
}

// Scalar division - returns invalid vector (NaN) if division by zero
Vec3 operator/(const Vec3 &v, double t) {
	if (t == 0.0) {
		return Vec3(NAN, NAN, NAN);
	}
	return (1 / t) * v;
}

Vec3 reflect(const Vec3 &incident, const Vec3 &normal) {
	return incident - 2 * incident.dot(normal) * normal;
}

std::optional<Vec3> refract(const Vec3 &incident, const Vec3 &normal, double refractive_index) {
	double cos_i = std::clamp(incident.dot(normal), -1.0, 1.0);
	double eta_i = 1.0;
	double eta_t = refractive_index;
	Vec3 n = normal;

	if (cos_i > 0.0) {
		// Leaving the medium: swap the indices and face the normal inwards.
		std::swap(eta_i, eta_t);
		n = -normal;
	} else {
		cos_i = -cos_i;
	}

	double eta = eta_i / eta_t;
	double k = 1.0 - eta * eta * (1.0 - cos_i * cos_i);
	if (k < 0.0) {
		return std::nullopt;
	}

	return incident * eta + n * (eta * cos_i - std::sqrt(k));
}

} // namespace prt
