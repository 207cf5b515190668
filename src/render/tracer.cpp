#include <algorithm>
#include <basic/math.h>
#include <cmath>
#include <render/tracer.h>

namespace prt {

namespace {

const Color3 SKY_BLUE(0.4, 0.6, 1.0);
const Color3 HORIZON_WHITE(0.9, 0.9, 1.0);
const Color3 CLOUD_WHITE(1.0, 1.0, 1.0);

void to_pixel(const TextureLookup &textures, const std::string &id, double u, double v, int &x, int &y) {
	x = static_cast<int>(u * textures.width(id));
	y = static_cast<int>(v * textures.height(id));
}

// Follow the mirror direction off the hit surface.
Color3 trace_reflection(const Ray &ray, const Intersect &intersect, const Vec3 &normal,
	const Scene &scene, const TextureLookup &textures, int depth) {
	Vec3 reflect_dir = reflect(ray.D, normal).normalized();
	Ray reflected(offset_origin(intersect, reflect_dir), reflect_dir);
	return cast_ray(reflected, scene, textures, depth + 1);
}

}

Color3 sample_texture(const TextureLookup &textures, const std::string &id, double u, double v) {
	int x, y;
	to_pixel(textures, id, u, v, x, y);
	return textures.get_pixel_color(id, x, y);
}

Color3 procedural_sky(const Vec3 &direction) {
	Vec3 d = direction.normalized();
	double t = (d.y() + 1.0) * 0.5;

	if (t < 0.3) {
		// Horizon
		double k = t / 0.3;
		return HORIZON_WHITE * (1.0 - k) + SKY_BLUE * k;
	} else if (t < 0.7) {
		// Sky with clouds
		double k = (t - 0.3) / 0.4;
		double cloud = std::sin(d.x() * 3.0) * std::cos(d.z() * 2.0) * 0.1;
		return SKY_BLUE * (1.0 - k) + CLOUD_WHITE * k + Color3(cloud, cloud, cloud);
	}
	return SKY_BLUE;
}

Color3 skybox_color(const Vec3 &direction, const Scene &scene, const TextureLookup &textures) {
	if (!scene.environment_map) {
		return procedural_sky(direction);
	}

	Vec3 d = direction.normalized();
	double u = 0.5 + std::atan2(d.x(), d.z()) / (2.0 * PI);
	double v = 0.5 - std::asin(std::clamp(d.y(), -1.0, 1.0)) / PI;
	return sample_texture(textures, *scene.environment_map, u, v);
}

Point3 offset_origin(const Intersect &intersect, const Vec3 &direction) {
	Vec3 offset = intersect.normal * ORIGIN_BIAS;
	if (direction.dot(intersect.normal) < 0.0) {
		return intersect.point - offset;
	}
	return intersect.point + offset;
}

std::pair<Vec3, Vec3> tangent_frame(const Vec3 &normal) {
	Vec3 tangent(normal.y(), -normal.x(), 0.0);
	if (tangent.near_zero()) {
		// Normal along +-Z, any tangent in the XY plane works.
		tangent = Vec3(1.0, 0.0, 0.0);
	}
	tangent.normalize();
	return { tangent, normal.cross(tangent) };
}

Vec3 shading_normal(const Intersect &intersect, const TextureLookup &textures) {
	const auto &normal_map = intersect.material->normal_map_id;
	if (!normal_map) {
		return intersect.normal;
	}

	int x, y;
	to_pixel(textures, *normal_map, intersect.u, intersect.v, x, y);
	Vec3 t = textures.get_normal_from_map(*normal_map, x, y);

	auto [tangent, bitangent] = tangent_frame(intersect.normal);
	return (t.x() * tangent + t.y() * bitangent + t.z() * intersect.normal).normalized();
}

double cast_shadow(const Intersect &intersect, const Light &light, const ObjectSet &objects) {
	Vec3 to_light = light.position - intersect.point;
	double light_distance = to_light.length();
	Vec3 light_dir = to_light.normalized();

	Ray shadow_ray(offset_origin(intersect, light_dir), light_dir);
	return objects.occluded(shadow_ray, light_distance) ? 1.0 : 0.0;
}

Color3 cast_ray(const Ray &ray, const Scene &scene, const TextureLookup &textures, int depth) {
	if (depth > MAX_DEPTH) {
		return skybox_color(ray.D, scene, textures);
	}

	Intersect intersect = scene.objects.nearest_hit(ray);
	if (!intersect.is_intersecting) {
		return skybox_color(ray.D, scene, textures);
	}

	const Material &material = *intersect.material;
	const Light &light = scene.light;

	Vec3 light_dir = (light.position - intersect.point).normalized();
	Vec3 view_dir = (ray.Q - intersect.point).normalized();
	Vec3 normal = shading_normal(intersect, textures);

	double shadow = cast_shadow(intersect, light, scene.objects);
	double light_intensity = light.intensity * (1.0 - shadow);

	// Local Phong color
	Color3 surface = material.texture_id
		? sample_texture(textures, *material.texture_id, intersect.u, intersect.v)
		: material.diffuse;
	double diffuse_intensity = std::fmax(0.0, normal.dot(light_dir)) * light_intensity;
	Color3 diffuse = surface * diffuse_intensity;

	Vec3 light_reflect = reflect(-light_dir, normal).normalized();
	double specular_intensity = std::pow(std::fmax(0.0, view_dir.dot(light_reflect)), material.specular) * light_intensity;
	Color3 specular = light.color3() * specular_intensity;

	Color3 phong = diffuse * material.albedo[ALBEDO_DIFFUSE]
		+ specular * material.albedo[ALBEDO_SPECULAR]
		+ material.emissive;

	double reflectivity = material.reflectivity();
	Color3 reflect_color;
	if (reflectivity > 0.0) {
		reflect_color = trace_reflection(ray, intersect, normal, scene, textures, depth);
	}

	double transparency = material.transparency();
	Color3 refract_color;
	if (transparency > 0.0) {
		std::optional<Vec3> refract_dir = refract(ray.D, normal, material.refractive_index);
		if (refract_dir) {
			Ray refracted(offset_origin(intersect, *refract_dir), *refract_dir);
			refract_color = cast_ray(refracted, scene, textures, depth + 1);
		} else {
			// Total internal reflection
			refract_color = trace_reflection(ray, intersect, normal, scene, textures, depth);
		}
	}

	// Weights are used as given, they are not renormalized.
	return phong * (1.0 - reflectivity - transparency) + reflect_color * reflectivity + refract_color * transparency;
}

}
