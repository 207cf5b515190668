#include "test_util.h"
#include <object/cube.h>
#include <stdexcept>

using namespace prt;
using prt::test::check_vec3;

TEST_CASE("Cube ray intersection", "[cube]") {
	Cube cube(Point3(0.0, 0.0, 0.0), 1.0, test::matte());

	/// Straight on from +Z hits the front face at t = 4.5.
	SECTION("Head-on hit") {
		Intersect hit = cube.intersect_ray(Ray(Point3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(4.5));
		check_vec3(hit.point, Point3(0.0, 0.0, 0.5));
		check_vec3(hit.normal, Vec3(0.0, 0.0, 1.0));
		CHECK(hit.u == Approx(0.5));
		CHECK(hit.v == Approx(0.5));
	}

	/// From above the top face is hit and mapped with (x, z).
	SECTION("Top face") {
		Intersect hit = cube.intersect_ray(Ray(Point3(0.25, 5.0, -0.25), Vec3(0.0, -1.0, 0.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(4.5));
		check_vec3(hit.normal, Vec3(0.0, 1.0, 0.0));
		CHECK(hit.u == Approx(0.75));
		CHECK(hit.v == Approx(0.25));
	}

	/// Side faces are mapped with (z, y).
	SECTION("Side face") {
		Intersect hit = cube.intersect_ray(Ray(Point3(-5.0, 0.3, 0.1), Vec3(1.0, 0.0, 0.0)));
		REQUIRE(hit.is_intersecting);
		check_vec3(hit.normal, Vec3(-1.0, 0.0, 0.0));
		CHECK(hit.u == Approx(0.6));
		CHECK(hit.v == Approx(0.8));
	}

	/// A ray starting inside hits the face it leaves through.
	SECTION("Origin inside") {
		Intersect hit = cube.intersect_ray(Ray(Point3(0.0, 0.0, 0.0), Vec3(1.0, 0.0, 0.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(0.5));
		check_vec3(hit.normal, Vec3(1.0, 0.0, 0.0));
	}

	/// Parallel to a slab and outside of it.
	SECTION("Miss beside the cube") {
		Intersect hit = cube.intersect_ray(Ray(Point3(2.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Cubes behind the origin are rejected.
	SECTION("Cube behind the ray") {
		Intersect hit = cube.intersect_ray(Ray(Point3(0.0, 0.0, -5.0), Vec3(0.0, 0.0, -1.0)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Diagonal rays miss once they pass the corner.
	SECTION("Diagonal miss") {
		Intersect hit = cube.intersect_ray(Ray(Point3(-5.0, 0.0, 5.0), Vec3(1.0, 0.0, -0.5)));
		CHECK_FALSE(hit.is_intersecting);
	}

	/// Running along a face plane with a zero direction component still hits;
	/// the |x| == |z| tie on the edge resolves to the z face.
	SECTION("Ray in a face plane") {
		Intersect hit = cube.intersect_ray(Ray(Point3(0.5, 0.0, 5.0), Vec3(0.0, 0.0, -1.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(4.5));
		check_vec3(hit.normal, Vec3(0.0, 0.0, 1.0));
	}

	/// Larger, translated cube.
	SECTION("Translated cube") {
		Cube big(Point3(1.0, 1.0, 1.0), 2.0, test::matte());
		CHECK(big.half_extent() == Approx(1.0));
		Intersect hit = big.intersect_ray(Ray(Point3(1.0, 1.0, 10.0), Vec3(0.0, 0.0, -1.0)));
		REQUIRE(hit.is_intersecting);
		CHECK(hit.distance == Approx(8.0));
	}
}

TEST_CASE("Cube face priority", "[cube]") {
	Cube cube(Point3(0.0, 0.0, 0.0), 1.0, test::matte());

	check_vec3(cube.face_normal(Point3(-0.5, 0.1, 0.2)), Vec3(-1.0, 0.0, 0.0));
	check_vec3(cube.face_normal(Point3(0.1, -0.5, 0.2)), Vec3(0.0, -1.0, 0.0));

	/// Ties fall through the x, y, z comparison chain.
	check_vec3(cube.face_normal(Point3(0.5, 0.5, 0.2)), Vec3(0.0, 1.0, 0.0));
	check_vec3(cube.face_normal(Point3(0.5, 0.2, 0.5)), Vec3(0.0, 0.0, 1.0));
	check_vec3(cube.face_normal(Point3(0.5, 0.5, 0.5)), Vec3(0.0, 0.0, 1.0));
}

TEST_CASE("Cube UV is clamped to the face", "[cube][uv]") {
	Cube cube(Point3(0.0, 0.0, 0.0), 1.0, test::matte());

	auto [u, v] = cube.uv(Point3(0.5, 0.6, -0.7), Vec3(1.0, 0.0, 0.0));
	CHECK(u == 0.0);
	CHECK(v == 1.0);
}

TEST_CASE("Cube construction is validated", "[cube]") {
	CHECK_THROWS_AS(Cube(Point3(), 0.0, test::matte()), std::invalid_argument);
	CHECK_THROWS_AS(Cube(Point3(), 1.0, nullptr), std::invalid_argument);
}
