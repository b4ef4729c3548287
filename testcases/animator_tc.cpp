#include <cmath>
#include <cstdlib>
#include <limits>

#include "animator.hpp"
#include "error.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace katzify {
static Shape line_shape(int n){
    Shape s;
    for(int i = 0; i < n; ++i) s.push_back({i, 2 * i});
    return s;
}

static ShapeList test_shapes(){
    return {line_shape(0), line_shape(1), line_shape(7), line_shape(10),
            line_shape(33), line_shape(100)};
}

// true if `sub` keeps the relative order of points in `s`
static bool is_subsequence(const Shape& sub, const Shape& s){
    size_t j = 0;
    for(size_t i = 0; i < s.size() && j < sub.size(); ++i)
        if(s[i] == sub[j]) ++j;
    return j == sub.size();
}

// ----------------------------------------------------------------

CATCH_TEST_CASE("AnimatorParams", "[animator]")
{
    AnimatorParams p;
    CATCH_REQUIRE_NOTHROW(validate(p));

    auto bad = [](auto modify){
        AnimatorParams q;
        modify(q);
        CATCH_REQUIRE_THROWS_AS(validate(q), InvalidParameterError);
        CATCH_REQUIRE_THROWS_AS(animate({line_shape(4)}, q), InvalidParameterError);
    };
    bad([](AnimatorParams& q) { q.shaky_freq = 0.0; });
    bad([](AnimatorParams& q) { q.shaky_freq = -0.5; });
    bad([](AnimatorParams& q) { q.sloppiness = 1.5; });
    bad([](AnimatorParams& q) { q.sloppiness = -0.1; });
    bad([](AnimatorParams& q){
        q.sloppiness = std::numeric_limits<double>::quiet_NaN();
    });
    bad([](AnimatorParams& q) { q.shakiness = -1; });
    bad([](AnimatorParams& q) { q.shakiness = kMaxShakiness + 1; });
    bad([](AnimatorParams& q) { q.shakiness = std::numeric_limits<int>::max(); });
    bad([](AnimatorParams& q) { q.frame_count = -1; });

    p.shakiness = kMaxShakiness;
    CATCH_REQUIRE_NOTHROW(validate(p));

    // frequencies above 1 are clamped, not rejected
    p.shaky_freq = 4.0;
    CATCH_REQUIRE_NOTHROW(validate(p));
}

CATCH_TEST_CASE("AnimatorPointBudget", "[animator]")
{
    const auto shapes = test_shapes();
    for(double sloppiness : {0.0, 0.1, 0.25, 0.5, 0.99, 1.0}){
        AnimatorParams p;
        p.sloppiness  = sloppiness;
        p.shakiness   = 0;
        p.shaky_freq  = 1.0;
        p.frame_count = 4;
        p.seed        = 1234;

        auto animation = animate(shapes, p);
        CATCH_REQUIRE(animation.size() == 4);
        for(const auto& frame : animation){
            CATCH_REQUIRE(frame.size() == shapes.size());
            for(size_t i = 0; i < shapes.size(); ++i){
                const size_t n    = shapes[i].size();
                const size_t drop = size_t(std::floor(sloppiness * double(n)));
                CATCH_REQUIRE(frame[i].size() == n - drop);
                // no jitter: survivors are the original points, in order
                CATCH_REQUIRE(is_subsequence(frame[i], shapes[i]));
            }
        }
    }
}

CATCH_TEST_CASE("AnimatorJitter", "[animator]")
{
    const auto shape = line_shape(200);

    CATCH_SECTION("bounded-by-shakiness"){
        AnimatorParams p;
        p.sloppiness = 0.0;
        p.shakiness  = 3;
        p.shaky_freq = 1.0;
        auto engine  = frame_engine(99, 0);
        auto out     = perturb_shape(shape, p, engine);
        CATCH_REQUIRE(out.size() == shape.size());
        bool moved = false;
        for(size_t i = 0; i < out.size(); ++i){
            CATCH_REQUIRE(std::abs(out[i].x - shape[i].x) <= 3);
            CATCH_REQUIRE(std::abs(out[i].y - shape[i].y) <= 3);
            if(out[i] != shape[i]) moved = true;
        }
        CATCH_REQUIRE(moved);
    }

    CATCH_SECTION("zero-shakiness-is-still"){
        AnimatorParams p;
        p.sloppiness = 0.0;
        p.shakiness  = 0;
        p.shaky_freq = 1.0;
        auto engine  = frame_engine(5, 3);
        CATCH_REQUIRE(perturb_shape(shape, p, engine) == shape);
    }

    CATCH_SECTION("points-may-leave-the-image"){
        AnimatorParams p;
        p.sloppiness = 0.0;
        p.shakiness  = 2;
        p.shaky_freq = 1.0;
        Shape corner(50, Point{0, 0});
        auto engine = frame_engine(7, 0);
        auto out    = perturb_shape(corner, p, engine);
        bool negative = false;
        for(const auto& q : out)
            if(q.x < 0 || q.y < 0) negative = true;
        CATCH_REQUIRE(negative);
    }

    CATCH_SECTION("everything-dropped"){
        AnimatorParams p;
        p.sloppiness = 1.0;
        auto engine  = frame_engine(1, 0);
        CATCH_REQUIRE(perturb_shape(shape, p, engine).empty());
        CATCH_REQUIRE(perturb_shape(Shape{}, p, engine).empty());
    }
}

CATCH_TEST_CASE("AnimatorDeterminism", "[animator]")
{
    const auto shapes = test_shapes();
    AnimatorParams p;
    p.sloppiness  = 0.3;
    p.shakiness   = 2;
    p.shaky_freq  = 0.5;
    p.frame_count = 6;
    p.seed        = 0xC0FFEE;

    CATCH_SECTION("same-seed-same-animation"){
        CATCH_REQUIRE(animate(shapes, p) == animate(shapes, p));
    }

    CATCH_SECTION("thread-count-does-not-matter"){
        p.threads   = 1;
        auto serial = animate(shapes, p);
        p.threads   = 4;
        CATCH_REQUIRE(animate(shapes, p) == serial);
    }

    CATCH_SECTION("frames-are-independent"){
        auto a = animate(shapes, p);
        CATCH_REQUIRE(a[0][5] != a[1][5]);
        p.seed = 0xBEEF;
        CATCH_REQUIRE(animate(shapes, p)[0][5] != a[0][5]);
    }

    CATCH_SECTION("source-is-not-mutated"){
        auto copy = shapes;
        animate(copy, p);
        CATCH_REQUIRE(copy == shapes);
    }

    CATCH_SECTION("no-frames"){
        p.frame_count = 0;
        CATCH_REQUIRE(animate(shapes, p).empty());
    }
}

} // namespace katzify
