#ifndef KATZIFY_GIF_HPP
#define KATZIFY_GIF_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "raster.hpp"

namespace katzify {

// Assemble frames into a GIF89a stream. The first frame's palette becomes
// the global color table; a frame with a different palette carries a local
// one. `delay_cs` is the per-frame delay in hundredths of a second; `loop`
// adds the NETSCAPE2.0 infinite-loop extension.
// Throws EncodeError on no frames, mismatched sizes, or a bad palette.
std::vector<uint8_t> encode_gif(const std::vector<IndexedImage> &frames, int delay_cs, bool loop = true);

// encode_gif() then write to `path`; EncodeError if the file can't be written
void write_gif(const std::string &path, const std::vector<IndexedImage> &frames, int delay_cs, bool loop = true);

// First image of a GIF stream as a raster indexed by the GIF color table
// (local table if the image has one). Throws DecodeError.
Raster decode_gif(const std::vector<uint8_t> &bytes);

// GIF LZW, exposed for tests
std::vector<uint8_t> lzw_encode(const std::vector<uint8_t> &indices, int min_code_size);
// decodes at most `max_pixels` indices; stops at end-of-information
std::vector<uint8_t> lzw_decode(const std::vector<uint8_t> &data, int min_code_size, size_t max_pixels);

} // namespace katzify

#endif
