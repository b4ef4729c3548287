#include "tracer.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <string>

using namespace std;

namespace katzify {

// ---------------------- Direction tables ----------------------
// indexed by Direction: Up, Down, Left, Right
static const array<Direction,4> LEFT_OF = {
    Direction::Left, Direction::Right, Direction::Down, Direction::Up
};
static const array<Direction,4> RIGHT_OF = {
    Direction::Right, Direction::Left, Direction::Up, Direction::Down
};
static const array<Point,4> OFFSET_OF = {
    Point{0,-1}, Point{0,1}, Point{-1,0}, Point{1,0}
};

Direction turn_left(Direction d){ return LEFT_OF[(size_t)d]; }
Direction turn_right(Direction d){ return RIGHT_OF[(size_t)d]; }
Point step(Point p, Direction d){
    Point o = OFFSET_OF[(size_t)d];
    return Point{ p.x + o.x, p.y + o.y };
}

// ---------------------- Erosion ----------------------
Raster erode(const Raster &src, ColorIndex clear_color, int blot_radius)
{
    if(blot_radius < 0) throw InvalidParameterError("blot radius must be >= 0, got " + to_string(blot_radius));
    int w = src.width(), h = src.height();
    Raster out(w, h, src.palette(), clear_color);
    blot_radius = min(blot_radius, max(w, h));  // larger blots clip to the same result
    for(int x=0;x<w;++x){
        for(int y=0;y<h;++y){
            ColorIndex c = src.color_at(x,y);
            if(c == clear_color) continue;
            int x0 = max(0, x - blot_radius), x1 = min(w - 1, x + blot_radius);
            int y0 = max(0, y - blot_radius), y1 = min(h - 1, y + blot_radius);
            for(int bx=x0; bx<=x1; ++bx)
                for(int by=y0; by<=y1; ++by)
                    out.set_color(bx, by, c);
        }
    }
    return out;
}

// ---------------------- Locate ----------------------
optional<Point> locate_shape(const Raster &raster, ColorIndex clear_color)
{
    for(int y=raster.height()-1; y>=0; --y){
        for(int x=raster.width()-1; x>=0; --x){
            if(raster.color_at(x,y) != clear_color) return Point{x,y};
        }
    }
    return nullopt;
}

// ---------------------- Ant tracing ----------------------
Shape trace_shape(const Raster &raster, ColorIndex clear_color, Point start, bool &closed)
{
    Shape shape;
    closed = false;
    if(!raster.in_bounds(start.x, start.y)) return shape;

    Point p = start;
    Direction dir = Direction::Up;
    while(true){
        if(raster.color_at(p.x, p.y) != clear_color){
            shape.push_back(p);
            dir = turn_left(dir);
        } else {
            dir = turn_right(dir);
        }
        p = step(p, dir);
        if(!raster.in_bounds(p.x, p.y)) break;
        if(p == start){ closed = true; break; }
    }
    return shape;
}

Shape trace_shape(const Raster &raster, ColorIndex clear_color, Point start)
{
    bool closed;
    return trace_shape(raster, clear_color, start, closed);
}

// ---------------------- Driver ----------------------
ShapeList trace_all(Raster &raster, ColorIndex clear_color)
{
    ShapeList shapes;
    while(auto xy = locate_shape(raster, clear_color)){
        shapes.push_back(trace_shape(raster, clear_color, *xy));
        raster.flood_fill(xy->x, xy->y, clear_color);
    }
    return shapes;
}

ShapeList trace_image(const Raster &src, ColorIndex clear_color, int blot_radius)
{
    Raster work = erode(src, clear_color, blot_radius);
    return trace_all(work, clear_color);
}

} // namespace katzify
