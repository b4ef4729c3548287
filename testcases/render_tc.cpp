#include <algorithm>

#include "raster.hpp"
#include "render.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace katzify {
static size_t ink_count(const IndexedImage& img){
    return size_t(std::count(img.pixels.begin(), img.pixels.end(), kInkIndex));
}

static bool is_ink(const IndexedImage& img, int x, int y){
    return img.pixels[size_t(y) * size_t(img.width) + size_t(x)] == kInkIndex;
}

// ----------------------------------------------------------------

CATCH_TEST_CASE("RenderFrame", "[render]")
{
    const uint32_t ink = pack_rgba(0, 0, 0);
    const uint32_t bg  = pack_rgba(255, 255, 255);
    const Shape square = {{2, 2}, {7, 2}, {7, 7}, {2, 7}};

    CATCH_SECTION("palette-and-size"){
        auto img = render_frame(12, 9, {}, ink, bg);
        CATCH_REQUIRE(img.width == 12);
        CATCH_REQUIRE(img.height == 9);
        CATCH_REQUIRE(img.palette == std::vector<uint32_t>{bg, ink});
        CATCH_REQUIRE(img.pixels.size() == 12 * 9);
        CATCH_REQUIRE(ink_count(img) == 0);
    }

    CATCH_SECTION("filled-square"){
        auto img = render_frame(10, 10, {square}, ink, bg, RenderMode::Filled);
        CATCH_REQUIRE(ink_count(img) == 36);
        for(int y = 2; y <= 7; ++y)
            for(int x = 2; x <= 7; ++x) CATCH_REQUIRE(is_ink(img, x, y));
    }

    CATCH_SECTION("outline-square"){
        auto img = render_frame(10, 10, {square}, ink, bg, RenderMode::Outline);
        CATCH_REQUIRE(ink_count(img) == 20);
        CATCH_REQUIRE(is_ink(img, 2, 2));
        CATCH_REQUIRE(is_ink(img, 7, 5));
        CATCH_REQUIRE(!is_ink(img, 4, 4));
    }

    CATCH_SECTION("open-contour-is-closed-by-the-fill"){
        // three corners of the square, as a border-truncated trace would give
        const Shape open = {{7, 7}, {7, 2}, {2, 2}};
        auto img         = render_frame(10, 10, {open}, ink, bg, RenderMode::Filled);
        CATCH_REQUIRE(is_ink(img, 6, 4));
        CATCH_REQUIRE(!is_ink(img, 3, 6));
        CATCH_REQUIRE(is_ink(img, 5, 5)); // on the closing diagonal
    }

    CATCH_SECTION("short-shapes-are-skipped"){
        const Frame frame = {Shape{}, Shape{{1, 1}}, Shape{{1, 1}, {8, 8}}};
        auto img          = render_frame(10, 10, frame, ink, bg);
        CATCH_REQUIRE(ink_count(img) == 0);
    }

    CATCH_SECTION("clipped-to-frame"){
        const Shape big = {{-5, -5}, {3, -5}, {3, 3}, {-5, 3}};
        auto img        = render_frame(10, 10, {big}, ink, bg);
        CATCH_REQUIRE(ink_count(img) == 16);
        CATCH_REQUIRE(is_ink(img, 0, 0));
        CATCH_REQUIRE(is_ink(img, 3, 3));
        CATCH_REQUIRE(!is_ink(img, 4, 4));

        const Shape far = {{100, 100}, {120, 100}, {120, 130}};
        CATCH_REQUIRE(ink_count(render_frame(10, 10, {far}, ink, bg)) == 0);
    }
}

CATCH_TEST_CASE("DrawLine", "[render]")
{
    IndexedImage img;
    img.width  = 8;
    img.height = 8;
    img.palette = {0u, 1u};
    img.pixels.assign(64, kBackgroundIndex);

    draw_line(img, {0, 0}, {7, 7}, kInkIndex);
    CATCH_REQUIRE(ink_count(img) == 8);
    for(int i = 0; i < 8; ++i) CATCH_REQUIRE(is_ink(img, i, i));

    img.pixels.assign(64, kBackgroundIndex);
    draw_line(img, {6, 3}, {1, 3}, kInkIndex);
    CATCH_REQUIRE(ink_count(img) == 6);

    img.pixels.assign(64, kBackgroundIndex);
    draw_line(img, {4, 4}, {4, 4}, kInkIndex);
    CATCH_REQUIRE(ink_count(img) == 1);
}

} // namespace katzify
