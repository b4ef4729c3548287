#include "ascii-raster.hpp"
#include "error.hpp"
#include "raster.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace katzify {
// ----------------------------------------------------------------

CATCH_TEST_CASE("Raster", "[raster]")
{
    CATCH_SECTION("pixel-buffer-must-match-size"){
        CATCH_REQUIRE_THROWS_AS(Raster(3, 3, test_palette(), std::vector<ColorIndex>(8)),
                                Error);
        CATCH_REQUIRE_THROWS_AS(Raster(-1, 3, test_palette(), k_white), Error);
        CATCH_REQUIRE_NOTHROW(Raster(0, 0, test_palette(), std::vector<ColorIndex>{}));
    }

    CATCH_SECTION("find-clear-color"){
        Raster r(2, 2, test_palette(), k_white);
        CATCH_REQUIRE(r.find_clear_color(255, 255, 255) == k_white);
        CATCH_REQUIRE(r.find_clear_color(255, 0, 0) == k_red);
        CATCH_REQUIRE(!r.find_clear_color(254, 255, 255).has_value());

        // a transparent white is not the clear color
        Raster t(1, 1, {pack_rgba(255, 255, 255, 0)}, 0);
        CATCH_REQUIRE(!t.find_clear_color(255, 255, 255).has_value());
    }

    CATCH_SECTION("flood-fill-concave-region"){
        auto r = ascii_raster({".........",
                               ".#.....#.",
                               ".#.....#.",
                               ".#.###.#.",
                               ".#######.",
                               ".........",
                               "..#.....#",
                               "........."});

        // the U is 4-connected; the two pixels below are separate regions
        const auto n = r.flood_fill(1, 1, k_white);
        CATCH_REQUIRE(n == 16);
        CATCH_REQUIRE(r.count_other_than(k_white) == 2);
        CATCH_REQUIRE(r.color_at(2, 6) == k_black);
        CATCH_REQUIRE(r.color_at(8, 6) == k_black);
    }

    CATCH_SECTION("flood-fill-is-4-connected"){
        auto r = ascii_raster({"#..", ".#.", "..#"});
        CATCH_REQUIRE(r.flood_fill(1, 1, k_white) == 1);
        CATCH_REQUIRE(r.color_at(0, 0) == k_black);
        CATCH_REQUIRE(r.color_at(2, 2) == k_black);
    }

    CATCH_SECTION("flood-fill-only-same-color"){
        auto r = ascii_raster({"##rr", "##rr"});
        CATCH_REQUIRE(r.flood_fill(0, 0, k_white) == 4);
        CATCH_REQUIRE(r.count_other_than(k_white) == 4);
        CATCH_REQUIRE(r.flood_fill(0, 0, k_white) == 0);
        CATCH_REQUIRE(r.flood_fill(9, 9, k_white) == 0);
    }
}

} // namespace katzify
