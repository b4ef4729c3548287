#ifndef KATZIFY_TESTCASES_ASCII_RASTER_HPP
#define KATZIFY_TESTCASES_ASCII_RASTER_HPP

#include <string>
#include <utility>
#include <vector>

#include "raster.hpp"

namespace katzify {
// Palette used by the ascii rasters: '.' white, '#' black, 'r' red.
constexpr ColorIndex k_white = 0;
constexpr ColorIndex k_black = 1;
constexpr ColorIndex k_red   = 2;

inline std::vector<uint32_t> test_palette(){
    return {pack_rgba(255, 255, 255), pack_rgba(0, 0, 0), pack_rgba(255, 0, 0)};
}

inline Raster ascii_raster(const std::vector<std::string>& rows){
    const int h = int(rows.size());
    const int w = h == 0 ? 0 : int(rows[0].size());
    std::vector<ColorIndex> pixels;
    pixels.reserve(size_t(w) * size_t(h));
    for(const auto& row : rows)
        for(char c : row)
            pixels.push_back(c == '#' ? k_black : c == 'r' ? k_red : k_white);
    return Raster(w, h, test_palette(), std::move(pixels));
}

// w*h white raster with a filled black rectangle [x0,x1]x[y0,y1]
inline Raster rect_raster(int w, int h, int x0, int y0, int x1, int y1){
    Raster r(w, h, test_palette(), k_white);
    for(int y = y0; y <= y1; ++y)
        for(int x = x0; x <= x1; ++x) r.set_color(x, y, k_black);
    return r;
}

} // namespace katzify

#endif
