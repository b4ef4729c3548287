#include "render.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

using namespace std;

namespace katzify {

static inline void plot(IndexedImage &img, int x, int y, uint8_t color){
    if(x < 0 || y < 0 || x >= img.width || y >= img.height) return;
    img.pixels[(size_t)y * img.width + x] = color;
}

void draw_line(IndexedImage &img, Point a, Point b, uint8_t color)
{
    int dx = abs(b.x - a.x), sx = a.x < b.x ? 1 : -1;
    int dy = -abs(b.y - a.y), sy = a.y < b.y ? 1 : -1;
    int err = dx + dy;
    int x = a.x, y = a.y;
    while(true){
        plot(img, x, y, color);
        if(x == b.x && y == b.y) break;
        int e2 = 2 * err;
        if(e2 >= dy){ err += dy; x += sx; }
        if(e2 <= dx){ err += dx; y += sy; }
    }
}

// ---------------------- Even-odd scanline fill ----------------------
static void fill_polygon(IndexedImage &img, const Shape &pts, uint8_t color)
{
    int miny = pts[0].y, maxy = pts[0].y;
    for(auto &p : pts){ miny = min(miny, p.y); maxy = max(maxy, p.y); }
    miny = max(miny, 0);
    maxy = min(maxy, img.height - 1);

    size_t n = pts.size();
    vector<double> xs;
    for(int y=miny; y<=maxy; ++y){
        xs.clear();
        for(size_t i=0;i<n;++i){
            const Point &a = pts[i];
            const Point &b = pts[(i + 1) % n];
            // half-open in y so shared vertices count once
            if((a.y <= y && b.y > y) || (b.y <= y && a.y > y)){
                xs.push_back(a.x + (double)(y - a.y) * (b.x - a.x) / (double)(b.y - a.y));
            }
        }
        sort(xs.begin(), xs.end());
        for(size_t i=0; i+1<xs.size(); i+=2){
            int x0 = max(0, (int)ceil(xs[i]));
            int x1 = min(img.width - 1, (int)floor(xs[i+1]));
            for(int x=x0; x<=x1; ++x) img.pixels[(size_t)y * img.width + x] = color;
        }
    }
}

void draw_polygon(IndexedImage &img, const Shape &pts, uint8_t color, bool filled)
{
    if(pts.empty()) return;
    if(filled) fill_polygon(img, pts, color);
    for(size_t i=0;i<pts.size();++i) draw_line(img, pts[i], pts[(i + 1) % pts.size()], color);
}

IndexedImage render_frame(int w, int h, const Frame &shapes, uint32_t ink, uint32_t background, RenderMode mode)
{
    IndexedImage img;
    img.width = w;
    img.height = h;
    img.palette = { background, ink };
    img.pixels.assign((size_t)w * h, kBackgroundIndex);
    for(auto &shape : shapes){
        // skip if we can't make a polygon
        if(shape.size() < 3) continue;
        draw_polygon(img, shape, kInkIndex, mode == RenderMode::Filled);
    }
    return img;
}

} // namespace katzify
