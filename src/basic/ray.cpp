#include <basic/ray.h>

namespace prt {

Ray::Ray(const Point3 &origin, const Vec3 &direction) : Q(origin), D(direction.normalized()) {
}

Point3 Ray::at(double t) const {
	return Q + D * t;
}

}
