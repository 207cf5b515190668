#ifndef PRT_INCLUDE_BASIC_VEC3_H
#define PRT_INCLUDE_BASIC_VEC3_H

#include <cmath>
#include <optional>

namespace prt {

class Vec3 {
private:
	double e_[3]; // x, y, z value

public:
	// Constructors
	Vec3();
	Vec3(double e0, double e1, double e2);

	// Component access
	double x() const;
	double y() const;
	double z() const;

	// Vector operations
	Vec3 operator-() const; // Negation
	double operator[](int i) const;
	double &operator[](int i);

	// Compound assignment operations
	Vec3 &operator/=(double t); // Returns invalid vector (NaN) if division by zero

	// Vector length operations
	double length() const;
	double length_squared() const;

	// Normalization - returns invalid vector (NaN) if length is zero
	Vec3 &normalize();
	Vec3 normalized() const;

	// Dot product
	double dot(const Vec3 &v) const;

	// Cross product
	Vec3 cross(const Vec3 &v) const;

	// Component-wise absolute value
	Vec3 abs() const;

	// Check if vector is near zero
	bool near_zero() const;

	// Check that no component is NaN or infinite
	bool is_finite() const;

	// Friend function declarations
	friend Vec3 operator+(const Vec3 &u, const Vec3 &v);
	friend Vec3 operator-(const Vec3 &u, const Vec3 &v);
	friend Vec3 operator*(const Vec3 &u, const Vec3 &v);
	friend Vec3 operator*(double t, const Vec3 &v);
	friend Vec3 operator*(const Vec3 &v, double t);
	friend Vec3 operator/(const Vec3 &v, double t);
};

// Vector operation friend function declarations
Vec3 operator+(const Vec3 &u, const Vec3 &v);
Vec3 operator-(const Vec3 &u, const Vec3 &v);
Vec3 operator*(const Vec3 &u, const Vec3 &v);
Vec3 operator*(double t, const Vec3 &v);
Vec3 operator*(const Vec3 &v, double t);
Vec3 operator/(const Vec3 &v, double t); // Returns invalid vector (NaN) if division by zero

// Mirror the incident vector about the normal: I - 2(I.N)N
Vec3 reflect(const Vec3 &incident, const Vec3 &normal);

// Snell refraction of the incident vector through a surface with the given
// outward normal. The sign of incident.normal decides whether the ray enters
// (1 -> refractive_index) or leaves (refractive_index -> 1) the medium.
// Returns std::nullopt on total internal reflection.
std::optional<Vec3> refract(const Vec3 &incident, const Vec3 &normal, double refractive_index);

// Some other type based on Vec3 class
using Point3 = Vec3;
using Color3 = Vec3;

}

#endif
