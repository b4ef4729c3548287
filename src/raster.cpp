#include "raster.hpp"
#include "error.hpp"

#include <algorithm>
#include <string>
#include <utility>

using namespace std;

namespace katzify {

Raster::Raster(int w, int h, vector<uint32_t> palette, ColorIndex fill)
    : w_(w), h_(h), palette_(move(palette))
{
    if(w < 0 || h < 0) throw Error("malformed raster: negative size");
    pixels_.assign((size_t)w * h, fill);
}

Raster::Raster(int w, int h, vector<uint32_t> palette, vector<ColorIndex> pixels)
    : w_(w), h_(h), palette_(move(palette)), pixels_(move(pixels))
{
    if(w < 0 || h < 0) throw Error("malformed raster: negative size");
    if(pixels_.size() != (size_t)w * h){
        throw Error("malformed raster: " + to_string(pixels_.size()) + " pixels for "
                    + to_string(w) + "x" + to_string(h));
    }
}

optional<ColorIndex> Raster::find_clear_color(int r, int g, int b) const
{
    uint32_t want = pack_rgba(r, g, b, 0xFF);
    for(size_t i=0; i<palette_.size(); ++i){
        if(palette_[i] == want) return (ColorIndex)i;
    }
    return nullopt;
}

// ---------------------- Span flood fill ----------------------
size_t Raster::flood_fill(int x, int y, ColorIndex c)
{
    if(!in_bounds(x,y)) return 0;
    ColorIndex old = color_at(x,y);
    if(old == c) return 0;

    // one entry per horizontal run still to be scanned for neighbours
    struct Span { int x1, x2, row; };
    vector<Span> stack;
    size_t changed = 0;

    auto fill_run = [&](int sx, int row)->Span{
        int lx = sx, rx = sx;
        while(lx > 0 && color_at(lx-1, row) == old) --lx;
        while(rx < w_-1 && color_at(rx+1, row) == old) ++rx;
        for(int i=lx;i<=rx;++i) set_color(i, row, c);
        changed += (size_t)(rx - lx + 1);
        return Span{lx, rx, row};
    };

    stack.push_back(fill_run(x, y));
    while(!stack.empty()){
        Span s = stack.back();
        stack.pop_back();
        for(int ny : { s.row - 1, s.row + 1 }){
            if(ny < 0 || ny >= h_) continue;
            for(int i=s.x1; i<=s.x2; ++i){
                if(color_at(i, ny) == old) stack.push_back(fill_run(i, ny));
            }
        }
    }
    return changed;
}

size_t Raster::count_other_than(ColorIndex c) const
{
    return (size_t)count_if(pixels_.begin(), pixels_.end(), [c](ColorIndex p){ return p != c; });
}

} // namespace katzify
