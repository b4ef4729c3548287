#ifndef KATZIFY_RENDER_HPP
#define KATZIFY_RENDER_HPP

#include <cstdint>

#include "animator.hpp"
#include "raster.hpp"

namespace katzify {

enum class RenderMode { Filled, Outline };

// Palette slots of a rendered frame.
constexpr uint8_t kBackgroundIndex = 0;
constexpr uint8_t kInkIndex = 1;

// Draw `shapes` on a w*h frame with palette {background, ink}. Shapes
// with fewer than 3 points are skipped; everything is clipped to the frame.
IndexedImage render_frame(int w, int h, const Frame &shapes, uint32_t ink, uint32_t background,
                          RenderMode mode = RenderMode::Filled);

// Bresenham segment, clipped.
void draw_line(IndexedImage &img, Point a, Point b, uint8_t color);

// Polygon through `pts` (closing edge implied). Filled uses the even-odd rule.
void draw_polygon(IndexedImage &img, const Shape &pts, uint8_t color, bool filled);

} // namespace katzify

#endif
