#ifndef KATZIFY_TRACER_HPP
#define KATZIFY_TRACER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "raster.hpp"

namespace katzify {

using Shape = std::vector<Point>;
using ShapeList = std::vector<Shape>;

// Side of the blot square is 2 * kDefaultBlotRadius + 1.
constexpr int kDefaultBlotRadius = 1;

// ---------------------- Ant direction state ----------------------
enum class Direction : uint8_t { Up = 0, Down = 1, Left = 2, Right = 3 };

// counterclockwise: Up->Left->Down->Right->Up
Direction turn_left(Direction d);
// clockwise: Up->Right->Down->Left->Up
Direction turn_right(Direction d);
// one pixel forward; y grows downwards
Point step(Point p, Direction d);

// Blot every non-clear pixel of `src` into a (2r+1)^2 square on a fresh
// all-clear raster with the same palette. Throws InvalidParameterError
// if blot_radius < 0.
Raster erode(const Raster &src, ColorIndex clear_color, int blot_radius = kDefaultBlotRadius);

// First non-clear pixel scanning rows bottom to top, columns right to left.
std::optional<Point> locate_shape(const Raster &raster, ColorIndex clear_color);

// Walk the boundary of the region at `start` with the ant rule. Stops
// back on `start` (closed = true) or on leaving the raster (closed =
// false, the contour is open).
Shape trace_shape(const Raster &raster, ColorIndex clear_color, Point start, bool &closed);
Shape trace_shape(const Raster &raster, ColorIndex clear_color, Point start);

// Locate, trace, then flood the region with the clear color until no
// foreground is left. `raster` ends up entirely clear.
ShapeList trace_all(Raster &raster, ColorIndex clear_color);

// erode + trace_all on a private copy; `src` is untouched
ShapeList trace_image(const Raster &src, ColorIndex clear_color, int blot_radius = kDefaultBlotRadius);

} // namespace katzify

#endif
