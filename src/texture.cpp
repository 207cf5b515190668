#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <texture.h>

namespace prt {

Texture::Texture(const std::string &image_path) {

	FILE *fp = fopen(image_path.c_str(), "rb");
	if (!fp) {
		throw std::runtime_error("Failed to open texture file: " + image_path);
	}

	// Read PPM header
	char format[3];
	if (fscanf(fp, "%2s", format) != 1 || std::string(format) != "P6") {
		fclose(fp);
		throw std::runtime_error("Unsupported PPM format in file: " + image_path);
	}
	int width, height, max_val;
	if (fscanf(fp, "%d %d %d", &width, &height, &max_val) != 3 || max_val != 255 || width <= 0 || height <= 0) {
		fclose(fp);
		throw std::runtime_error("Invalid PPM header in file: " + image_path);
	}
	fgetc(fp); // Consume the newline after max_val
	width_ = width, height_ = height;

	image_.resize(static_cast<std::size_t>(width) * height);

	// Read pixel data
	for (Color3 &color : image_) {
		unsigned char rgb[3];
		if (fread(rgb, sizeof(unsigned char), 3, fp) != 3) {
			fclose(fp);
			throw std::runtime_error("Unexpected end of file while reading pixel data in file: " + image_path);
		}
		color = Color3(static_cast<double>(rgb[0]) / 255.0,
			static_cast<double>(rgb[1]) / 255.0,
			static_cast<double>(rgb[2]) / 255.0);
	}
	fclose(fp);
}

Texture::Texture(int width, int height, const Color3 &fill_color) : width_(width), height_(height) {
	if (width <= 0 || height <= 0) {
		throw std::invalid_argument("Texture width and height must be positive.");
	}

	image_.assign(static_cast<std::size_t>(width) * height, fill_color);
}

Color3 &Texture::pixel(int x, int y) {
	return image_[index_of(x, y)];
}

const Color3 &Texture::pixel(int x, int y) const {
	return image_[index_of(x, y)];
}

std::size_t Texture::index_of(int x, int y) const {
	if (x < 0 || y < 0 || x >= width_ || y >= height_) {
		throw std::out_of_range("Texture pixel out of range: (" + std::to_string(x) + ", " + std::to_string(y) + ")");
	}

	return static_cast<std::size_t>(y) * width_ + x;
}

bool Texture::save_texture(const std::string &file_path) const {
	if (image_.empty()) {
		throw std::runtime_error("Texture is not initialized.");
	}

	// Only support PPM format for simplicity.
	if (file_path.size() < 4 || file_path.substr(file_path.size() - 4) != ".ppm") {
		return false;
	}

	FILE *fp = fopen(file_path.c_str(), "wb");
	if (!fp) {
		return false;
	}

	// Write PPM header
	fprintf(fp, "P6\n%d %d\n255\n", width_, height_);

	// Write pixel data
	bool ok = true;
	for (const Color3 &color : image_) {
		Rgb8 rgb = to_rgb8(color);
		unsigned char bytes[3] = { rgb.r, rgb.g, rgb.b };
		if (fwrite(bytes, sizeof(unsigned char), 3, fp) != 3) {
			ok = false;
			break;
		}
	}

	return fclose(fp) == 0 && ok;
}

int Texture::width() const {
	return width_;
}

int Texture::height() const {
	return height_;
}

Rgb8 to_rgb8(const Color3 &color) {
	auto channel = [](double c) {
		if (!std::isfinite(c)) {
			return std::uint8_t { 0 };
		}
		return static_cast<std::uint8_t>(std::clamp(c, 0.0, 1.0) * 255.0);
	};
	return Rgb8 { channel(color.x()), channel(color.y()), channel(color.z()) };
}

}
