#pragma once
#include <string>
#include <vector>
#include "image.h"

namespace fastblur {

enum class ImageFormat { Unknown, Png, Jpeg };

// By file extension, case-insensitive (.png, .jpg, .jpeg).
ImageFormat format_from_path(const std::string& path);

// All loaders/savers: on failure, throw std::runtime_error with a message if
// throw_on_error=true, else return false.

// 8-bit gray, gray+alpha, RGB or RGBA; 16-bit samples are stripped to 8 bits,
// palettes expanded to RGB, tRNS chunks expanded to alpha.
bool load_png(const std::string& path, Image& out, bool throw_on_error = true);
// 1 to 4 channels.
bool save_png(const std::string& path, const Image& img, bool throw_on_error = true);

// Gray or RGB.
bool load_jpeg(const std::string& path, Image& out, bool throw_on_error = true);
// 1 or 3 channels; quality is clamped to 1..100.
bool encode_jpeg_mem(const Image& img, int quality, std::vector<unsigned char>& out, bool throw_on_error = true);
bool save_jpeg(const std::string& path, const Image& img, int quality, bool throw_on_error = true);

// Dispatch on format_from_path().
bool load_image(const std::string& path, Image& out, bool throw_on_error = true);
bool save_image(const std::string& path, const Image& img, int jpeg_quality = 90, bool throw_on_error = true);

} // namespace fastblur
