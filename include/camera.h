#ifndef PRT_INCLUDE_CAMERA_H
#define PRT_INCLUDE_CAMERA_H

#include <basic/vec3.h>

namespace prt {

// Closest the eye may get to the target when zooming.
constexpr double MIN_ZOOM_DISTANCE = 0.5;

// Pitch stays this far away from straight up/down so the basis never flips.
constexpr double PITCH_MARGIN = 0.1;

// Look-at camera orbiting around a target point.
class Camera {
public:
	// Constructors
	Camera() = delete;
	Camera(const Point3 &eye, const Point3 &target, const Vec3 &up);

	// Transform a camera space direction (forward is -Z) into world space.
	Vec3 basis_change(const Vec3 &direction) const;

	// Rotate the eye around the target by the given yaw and pitch deltas (radians).
	// Yaw turns about the world up vector, pitch is measured from the plane normal to it.
	void orbit(double delta_yaw, double delta_pitch);

	// Move the eye delta units towards the target (negative moves away).
	void zoom(double delta);

	const Point3 &eye() const;
	const Point3 &target() const;
	const Vec3 &forward() const;
	const Vec3 &right() const;
	const Vec3 &up() const;

private:
	// Rebuild forward/right/up from eye, target and world up.
	void update_basis();

	Point3 eye_;
	Point3 target_;
	Vec3 world_up_;

	// Derived basis
	Vec3 forward_;
	Vec3 right_;
	Vec3 up_;
};

}

#endif
