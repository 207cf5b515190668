#include "test_util.h"
#include <basic/math.h>
#include <cmath>
#include <object/sphere.h>
#include <stdexcept>

using namespace prt;
using prt::test::check_vec3;

TEST_CASE("Sphere ray intersection", "[sphere]") {
	Sphere sphere(Point3(0.0, 0.0, 0.0), 1.0, test::matte());

	/// Straight on from +Z hits the near side at t = 4.
	SECTION("Head-on hit") {
		Intersect hit = sphere.intersect_ray(Ray(Point3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(4.0));
		check_vec3(hit.point, Point3(0.0, 0.0, 1.0));
		check_vec3(hit.normal, Vec3(0.0, 0.0, 1.0));
		CHECK(hit.material == sphere.material());
		CHECK(hit.u == Approx(0.5));
		CHECK(hit.v == Approx(0.5));
	}

	/// A ray passing above the sphere misses.
	SECTION("Miss") {
		Intersect hit = sphere.intersect_ray(Ray(Point3(0.0, 2.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// A zero discriminant counts as a miss.
	SECTION("Grazing ray") {
		Intersect hit = sphere.intersect_ray(Ray(Point3(0.0, 1.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Spheres behind the origin are rejected.
	SECTION("Sphere behind the ray") {
		Intersect hit = sphere.intersect_ray(Ray(Point3(0.0, 0.0, -5.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Only the near root is considered, so a ray starting inside misses.
	SECTION("Origin inside") {
		Intersect hit = sphere.intersect_ray(Ray(Point3(0.0, 0.0, 0.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Off-center sphere with a larger radius.
	SECTION("Translated sphere") {
		Sphere big(Point3(1.0, 2.0, -3.0), 2.0, test::matte());
		Intersect hit = big.intersect_ray(Ray(Point3(1.0, 10.0, -3.0), Vec3(0.0, -1.0, 0.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(6.0));
		check_vec3(hit.normal, Vec3(0.0, 1.0, 0.0));
		CHECK(hit.v == Approx(0.0).margin(1e-12));
	}
}

TEST_CASE("Sphere UV mapping", "[sphere][uv]") {
	Sphere sphere(Point3(0.0, 0.0, 0.0), 2.0, test::matte());

	/// Every hit lands in the unit square.
	SECTION("Range") {
		for (double theta = 0.1; theta < PI; theta += 0.3) {
			for (double phi = -PI; phi < PI; phi += 0.4) {
				Point3 p(2.0 * std::sin(theta) * std::sin(phi), 2.0 * std::cos(theta), 2.0 * std::sin(theta) * std::cos(phi));
				auto [u, v] = sphere.uv(p);
				CHECK(u >= 0.0);
				CHECK(u <= 1.0);
				CHECK(v >= 0.0);
				CHECK(v <= 1.0);
			}
		}
	}

	/// Near the top pole v goes to 0 whatever the longitude.
	SECTION("Top pole is stable") {
		const double eps = 1e-6;
		for (double phi = -PI; phi < PI; phi += PI / 8.0) {
			Point3 p(2.0 * eps * std::sin(phi), 2.0 * std::sqrt(1.0 - eps * eps), 2.0 * eps * std::cos(phi));
			CHECK(sphere.uv(p).second == Approx(0.0).margin(1e-5));
		}
		CHECK(sphere.uv(Point3(0.0, 2.0, 0.0)).second == Approx(0.0).margin(1e-12));
	}

	/// The bottom pole maps to v = 1.
	SECTION("Bottom pole") {
		CHECK(sphere.uv(Point3(0.0, -2.0, 0.0)).second == Approx(1.0));
	}

	/// A point nudged past the pole by rounding still gives a finite v.
	SECTION("Rounding spill at the pole") {
		auto [u, v] = sphere.uv(Point3(0.0, 2.0 + 1e-12, 0.0));
		CHECK(std::isfinite(u));
		CHECK(v == Approx(0.0).margin(1e-12));
	}
}

TEST_CASE("Sphere construction is validated", "[sphere]") {
	CHECK_THROWS_AS(Sphere(Point3(), 0.0, test::matte()), std::invalid_argument);
	CHECK_THROWS_AS(Sphere(Point3(), -1.0, test::matte()), std::invalid_argument);
	CHECK_THROWS_AS(Sphere(Point3(), 1.0, nullptr), std::invalid_argument);
}
