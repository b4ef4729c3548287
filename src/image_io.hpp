#ifndef KATZIFY_IMAGE_IO_HPP
#define KATZIFY_IMAGE_IO_HPP

#include <string>
#include <vector>

#include "raster.hpp"

namespace katzify {

// Decode `filename` into 8-bit RGBA. false if the file can't be read as PNG.
bool load_png_rgba(const std::string &filename, int &width, int &height, std::vector<unsigned char> &out_rgba);

// Same for baseline/progressive JPEG; grayscale is widened to RGB.
bool load_jpeg_rgba(const std::string &filename, int &width, int &height, std::vector<unsigned char> &out_rgba);

// Index an RGBA buffer: palette entries in order of first appearance, row-major.
Raster index_rgba(int width, int height, const std::vector<unsigned char> &rgba);

// Load an image as a palette raster, format guessed by extension:
// .png through libpng, .jpg/.jpeg through libjpeg, .gif and anything
// unknown through the gif reader. Images over kMaxPixels and allocation
// failures are reported as DecodeError too.
Raster load_raster(const std::string &path);

// "RRGGBB" or "#RRGGBB" -> opaque packed RGBA. Throws InvalidParameterError.
uint32_t parse_hex_color(const std::string &s);

} // namespace katzify

#endif
