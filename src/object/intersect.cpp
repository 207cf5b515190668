#include <object/intersect.h>
#include <utility>

namespace prt {

Intersect::Intersect(const Point3 &point, const Vec3 &normal, double distance, MaterialPtr material, double u, double v)
	: is_intersecting(true), point(point), normal(normal), distance(distance), material(std::move(material)), u(u), v(v) {
}

Intersect Intersect::empty() {
	return Intersect();
}

}
