#include <algorithm>
#include <limits>

#include "ascii-raster.hpp"
#include "error.hpp"
#include "tracer.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace katzify {
static void bounding_box(const Raster& r, ColorIndex clear, int& x0, int& y0,
                         int& x1, int& y1){
    x0 = r.width();
    y0 = r.height();
    x1 = y1 = -1;
    for(int y = 0; y < r.height(); ++y)
        for(int x = 0; x < r.width(); ++x)
            if(r.color_at(x, y) != clear){
                x0 = std::min(x0, x);
                y0 = std::min(y0, y);
                x1 = std::max(x1, x);
                y1 = std::max(y1, y);
            }
}

// ----------------------------------------------------------------

CATCH_TEST_CASE("AntDirections", "[tracer]")
{
    const Direction all[] = {Direction::Up, Direction::Down, Direction::Left,
                             Direction::Right};

    CATCH_REQUIRE(turn_left(Direction::Up) == Direction::Left);
    CATCH_REQUIRE(turn_left(Direction::Left) == Direction::Down);
    CATCH_REQUIRE(turn_left(Direction::Down) == Direction::Right);
    CATCH_REQUIRE(turn_left(Direction::Right) == Direction::Up);

    CATCH_REQUIRE(turn_right(Direction::Up) == Direction::Right);
    CATCH_REQUIRE(turn_right(Direction::Right) == Direction::Down);
    CATCH_REQUIRE(turn_right(Direction::Down) == Direction::Left);
    CATCH_REQUIRE(turn_right(Direction::Left) == Direction::Up);

    for(auto d : all){
        CATCH_REQUIRE(turn_right(turn_left(d)) == d);
        CATCH_REQUIRE(turn_left(turn_left(turn_left(turn_left(d)))) == d);
    }

    CATCH_REQUIRE(step({5, 5}, Direction::Up) == Point{5, 4});
    CATCH_REQUIRE(step({5, 5}, Direction::Down) == Point{5, 6});
    CATCH_REQUIRE(step({5, 5}, Direction::Left) == Point{4, 5});
    CATCH_REQUIRE(step({5, 5}, Direction::Right) == Point{6, 5});
}

CATCH_TEST_CASE("Erode", "[tracer]")
{
    CATCH_SECTION("single-pixel-becomes-blot"){
        auto r   = rect_raster(10, 10, 5, 5, 5, 5);
        auto out = erode(r, k_white, 1);
        CATCH_REQUIRE(out.count_other_than(k_white) == 9);
        int x0, y0, x1, y1;
        bounding_box(out, k_white, x0, y0, x1, y1);
        CATCH_REQUIRE((x0 == 4 && y0 == 4 && x1 == 6 && y1 == 6));
        CATCH_REQUIRE(r.count_other_than(k_white) == 1); // source untouched
        CATCH_REQUIRE(out.palette() == r.palette());
    }

    CATCH_SECTION("blot-clipped-at-border"){
        auto out = erode(rect_raster(10, 10, 0, 0, 0, 0), k_white, 1);
        CATCH_REQUIRE(out.count_other_than(k_white) == 4);
        out = erode(rect_raster(10, 10, 9, 9, 9, 9), k_white, 2);
        CATCH_REQUIRE(out.count_other_than(k_white) == 9);
    }

    CATCH_SECTION("radius-zero-is-copy"){
        auto r   = ascii_raster({"#..", ".r.", "..#"});
        auto out = erode(r, k_white, 0);
        CATCH_REQUIRE(out.pixels() == r.pixels());
    }

    CATCH_SECTION("negative-radius"){
        CATCH_REQUIRE_THROWS_AS(erode(rect_raster(4, 4, 1, 1, 2, 2), k_white, -1),
                                InvalidParameterError);
    }

    CATCH_SECTION("huge-radius-fills-raster"){
        auto out = erode(rect_raster(6, 4, 2, 1, 2, 1), k_white,
                         std::numeric_limits<int>::max());
        CATCH_REQUIRE(out.count_other_than(k_white) == 24);
    }

    CATCH_SECTION("growth-of-solid-block"){
        // 3x3 block grows by r per side per pass, and stays solid
        auto r = rect_raster(12, 12, 4, 4, 6, 6);
        for(int radius = 1; radius <= 2; ++radius){
            auto once  = erode(r, k_white, radius);
            auto twice = erode(once, k_white, radius);
            int x0, y0, x1, y1;
            bounding_box(twice, k_white, x0, y0, x1, y1);
            CATCH_REQUIRE(x0 == 4 - 2 * radius);
            CATCH_REQUIRE(y0 == 4 - 2 * radius);
            CATCH_REQUIRE(x1 == 6 + 2 * radius);
            CATCH_REQUIRE(y1 == 6 + 2 * radius);
            const int side = 3 + 4 * radius;
            CATCH_REQUIRE(twice.count_other_than(k_white) == size_t(side * side));
        }
    }

    CATCH_SECTION("closes-broken-line"){
        // the gap at x=4 closes, giving one traceable region
        auto r = ascii_raster({"..........",
                               "..........",
                               "..........",
                               "...#.#....",
                               "..........",
                               "..........",
                               ".........."});
        CATCH_REQUIRE(trace_image(r, k_white, 0).size() == 2);
        CATCH_REQUIRE(trace_image(r, k_white, 1).size() == 1);
    }
}

CATCH_TEST_CASE("LocateShape", "[tracer]")
{
    auto r = ascii_raster({"..........",
                           ".#........",
                           "..........",
                           "..#.....#.",
                           ".........."});

    // bottom row first, rightmost first
    auto p = locate_shape(r, k_white);
    CATCH_REQUIRE(p.has_value());
    CATCH_REQUIRE(*p == Point{8, 3});
    r.set_color(8, 3, k_white);
    CATCH_REQUIRE(*locate_shape(r, k_white) == Point{2, 3});
    r.set_color(2, 3, k_white);
    CATCH_REQUIRE(*locate_shape(r, k_white) == Point{1, 1});
    r.set_color(1, 1, k_white);
    CATCH_REQUIRE(!locate_shape(r, k_white).has_value());

    CATCH_REQUIRE(!locate_shape(Raster(0, 0, test_palette(), k_white), k_white));
}

CATCH_TEST_CASE("TraceShape", "[tracer]")
{
    CATCH_SECTION("single-pixel"){
        auto r      = rect_raster(10, 10, 5, 5, 5, 5);
        bool closed = false;
        auto shape  = trace_shape(r, k_white, {5, 5}, closed);
        CATCH_REQUIRE(closed);
        CATCH_REQUIRE(shape == Shape{{5, 5}});
    }

    CATCH_SECTION("two-pixel-bar"){
        auto r      = rect_raster(10, 10, 5, 5, 6, 5);
        bool closed = false;
        auto shape  = trace_shape(r, k_white, {6, 5}, closed);
        CATCH_REQUIRE(closed);
        CATCH_REQUIRE(shape == Shape{{6, 5}, {5, 5}, {5, 5}});
    }

    CATCH_SECTION("interior-blob-closes"){
        auto r      = ascii_raster({"...........",
                                    "....###....",
                                    "...#####...",
                                    "..#######..",
                                    "...####....",
                                    "....##.....",
                                    "..........."});
        const auto start = *locate_shape(r, k_white);
        CATCH_REQUIRE(start == Point{5, 5});
        bool closed = false;
        auto shape  = trace_shape(r, k_white, start, closed);
        CATCH_REQUIRE(closed);
        CATCH_REQUIRE(!shape.empty());
        CATCH_REQUIRE(shape.front() == start);
        for(const auto& p : shape) CATCH_REQUIRE(r.color_at(p.x, p.y) != k_white);

        // every row of the blob is touched by the outline
        for(int y = 1; y <= 5; ++y)
            CATCH_REQUIRE(std::any_of(shape.begin(), shape.end(),
                                      [y](const Point& p) { return p.y == y; }));
    }

    CATCH_SECTION("open-contour-at-corner"){
        auto r      = rect_raster(10, 10, 0, 0, 2, 2);
        bool closed = true;
        auto shape  = trace_shape(r, k_white, {2, 2}, closed);
        CATCH_REQUIRE(!closed);
        CATCH_REQUIRE(shape == Shape{{2, 2}, {1, 2}, {0, 2}});
    }

    CATCH_SECTION("start-out-of-bounds"){
        auto r      = rect_raster(4, 4, 1, 1, 2, 2);
        bool closed = true;
        CATCH_REQUIRE(trace_shape(r, k_white, {4, 0}, closed).empty());
        CATCH_REQUIRE(!closed);
    }
}

CATCH_TEST_CASE("TraceAll", "[tracer]")
{
    CATCH_SECTION("k-disjoint-blobs"){
        auto r = ascii_raster({"............",
                               ".##.........",
                               ".##.....#...",
                               "........#...",
                               "...rr...#...",
                               "...r........",
                               "............",
                               ".......###..",
                               "............"});
        auto shapes = trace_all(r, k_white);
        CATCH_REQUIRE(shapes.size() == 4);
        CATCH_REQUIRE(r.count_other_than(k_white) == 0);

        // extraction order follows the locate scan
        CATCH_REQUIRE(shapes[0].front() == Point{9, 7});
        CATCH_REQUIRE(shapes[1].front() == Point{3, 5});
        CATCH_REQUIRE(shapes[2].front() == Point{8, 4});
        CATCH_REQUIRE(shapes[3].front() == Point{2, 2});
        for(const auto& s : shapes) CATCH_REQUIRE(!s.empty());
    }

    CATCH_SECTION("empty-raster"){
        Raster r(5, 5, test_palette(), k_white);
        CATCH_REQUIRE(trace_all(r, k_white).empty());
    }

    CATCH_SECTION("trace-image-keeps-source"){
        auto r = rect_raster(10, 10, 3, 3, 6, 6);
        auto before = r.pixels();
        auto shapes = trace_image(r, k_white, 1);
        CATCH_REQUIRE(shapes.size() == 1);
        CATCH_REQUIRE(r.pixels() == before);
        // the eroded square spans 2..7
        CATCH_REQUIRE(shapes[0].front() == Point{7, 7});
        for(const auto& p : shapes[0]){
            CATCH_REQUIRE((p.x >= 2 && p.x <= 7 && p.y >= 2 && p.y <= 7));
        }
    }
}

} // namespace katzify
