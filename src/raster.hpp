#ifndef KATZIFY_RASTER_HPP
#define KATZIFY_RASTER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace katzify {

using ColorIndex = int;

// largest image the loaders accept (width*height)
const size_t kMaxPixels = size_t(1) << 26;

// Pixel integer point
struct Point { int x, y; };
inline bool operator==(Point const& A, Point const& B){ return A.x==B.x && A.y==B.y; }
inline bool operator!=(Point const& A, Point const& B){ return !(A==B); }

// pack/unpack convenience, 0xRRGGBBAA
inline uint32_t pack_rgba(int r, int g, int b, int a = 0xFF){
    return ((uint32_t)(r & 0xFF)<<24) | ((uint32_t)(g & 0xFF)<<16) | ((uint32_t)(b & 0xFF)<<8) | (uint32_t)(a & 0xFF);
}
inline uint32_t pack_rgba(const unsigned char* p){
    return ((uint32_t)p[0]<<24) | ((uint32_t)p[1]<<16) | ((uint32_t)p[2]<<8) | ((uint32_t)p[3]);
}
inline void unpack_rgba(uint32_t v, int &r, int &g, int &b, int &a){
    r = (v>>24)&0xFF; g=(v>>16)&0xFF; b=(v>>8)&0xFF; a=v&0xFF;
}

// Palette-indexed pixel grid. Every pixel holds an index into palette().
class Raster {
public:
    Raster() = default;
    // w*h raster of `fill`
    Raster(int w, int h, std::vector<uint32_t> palette, ColorIndex fill = 0);
    // takes ownership of a row-major pixel buffer; throws Error if it isn't w*h
    Raster(int w, int h, std::vector<uint32_t> palette, std::vector<ColorIndex> pixels);

    int width() const { return w_; }
    int height() const { return h_; }
    bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < w_ && y < h_; }

    ColorIndex color_at(int x, int y) const { return pixels_[(size_t)y * w_ + x]; }
    void set_color(int x, int y, ColorIndex c) { pixels_[(size_t)y * w_ + x] = c; }

    const std::vector<uint32_t>& palette() const { return palette_; }
    const std::vector<ColorIndex>& pixels() const { return pixels_; }

    // exact RGB match against fully opaque palette entries
    std::optional<ColorIndex> find_clear_color(int r, int g, int b) const;

    // 4-connected fill of the region of color_at(x,y); returns pixels changed
    size_t flood_fill(int x, int y, ColorIndex c);

    // number of pixels not equal to `c`
    size_t count_other_than(ColorIndex c) const;

private:
    int w_ = 0, h_ = 0;
    std::vector<uint32_t> palette_;
    std::vector<ColorIndex> pixels_;
};

// Rendered output frame: 8-bit indices into an RGBA palette of <= 256 entries.
struct IndexedImage {
    int width = 0, height = 0;
    std::vector<uint32_t> palette;
    std::vector<uint8_t> pixels; // width*height, row-major
};

} // namespace katzify

#endif
