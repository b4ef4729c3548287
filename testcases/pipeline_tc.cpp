#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "ascii-raster.hpp"
#include "error.hpp"
#include "gif.hpp"
#include "katzify.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace fs = std::filesystem;

namespace katzify {
// ----------------------------------------------------------------

CATCH_TEST_CASE("SquareScenario", "[pipeline]")
{
    // 10x10, filled 4x4 square at (3,3)-(6,6), no sloppiness, no shake
    const auto raster = rect_raster(10, 10, 3, 3, 6, 6);

    Options opt;
    opt.sloppiness  = 0.0;
    opt.shakiness   = 0;
    opt.shaky_freq  = 1.0;
    opt.frame_count = 3;
    opt.blot_radius = 1;
    opt.seed        = 17;
    opt.threads     = 2;

    const auto shapes = trace_image(raster, k_white, opt.blot_radius);
    CATCH_REQUIRE(shapes.size() == 1);
    CATCH_REQUIRE(!shapes[0].empty());

    const auto animation = animate(shapes, animator_params(opt));
    CATCH_REQUIRE(animation.size() == 3);
    for(const auto& frame : animation){
        CATCH_REQUIRE(frame.size() == 1);
        CATCH_REQUIRE(frame[0] == shapes[0]);
    }

    std::stringstream log;
    const auto images = render_frames(raster, opt, log);
    CATCH_REQUIRE(images.size() == 3);
    CATCH_REQUIRE(images[0].pixels == images[1].pixels);
    CATCH_REQUIRE(images[1].pixels == images[2].pixels);
    CATCH_REQUIRE(log.str().empty()); // quiet unless verbose

    // the eroded square 2..7 is inked, the corners are not
    auto at = [&](int x, int y) { return images[0].pixels[size_t(y * 10 + x)]; };
    CATCH_REQUIRE(at(2, 2) == kInkIndex);
    CATCH_REQUIRE(at(7, 7) == kInkIndex);
    CATCH_REQUIRE(at(4, 5) == kInkIndex);
    CATCH_REQUIRE(at(0, 0) == kBackgroundIndex);
    CATCH_REQUIRE(at(9, 9) == kBackgroundIndex);
}

CATCH_TEST_CASE("PipelineErrors", "[pipeline]")
{
    std::stringstream log;

    CATCH_SECTION("no-clear-color"){
        Raster r(4, 4, {pack_rgba(0, 0, 0), pack_rgba(10, 10, 10)}, 0);
        Options opt;
        CATCH_REQUIRE_THROWS_AS(render_frames(r, opt, log), NoClearColorError);

        opt.clear_color = pack_rgba(10, 10, 10);
        CATCH_REQUIRE_NOTHROW(render_frames(r, opt, log));
    }

    CATCH_SECTION("zero-shaky-frequency"){
        Options opt;
        opt.shaky_freq = 0.0;
        CATCH_REQUIRE_THROWS_AS(render_frames(rect_raster(6, 6, 2, 2, 3, 3), opt, log),
                                InvalidParameterError);
    }

    CATCH_SECTION("negative-frame-count"){
        Options opt;
        opt.frame_count = -2;
        CATCH_REQUIRE_THROWS_AS(render_frames(rect_raster(6, 6, 2, 2, 3, 3), opt, log),
                                InvalidParameterError);
    }
}

CATCH_TEST_CASE("ParseNumbers", "[pipeline]")
{
    CATCH_REQUIRE(parse_double("-s", "0.25") == 0.25);
    CATCH_REQUIRE(parse_int("-n", "12") == 12);
    CATCH_REQUIRE(parse_u64("--seed", "18446744073709551615") == ~uint64_t(0));
    CATCH_REQUIRE(parse_u64("--seed", "0") == uint64_t(0));

    CATCH_REQUIRE_THROWS_AS(parse_int("-n", "12x"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_int("-n", "99999999999"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_double("-s", ""), InvalidParameterError);

    // negative seeds are rejected, not wrapped
    CATCH_REQUIRE_THROWS_AS(parse_u64("--seed", "-1"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_u64("--seed", " -1"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_u64("--seed", "+1"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_u64("--seed", "18446744073709551616"),
                            InvalidParameterError);
}

CATCH_TEST_CASE("RenderFile", "[pipeline]")
{
    const auto dir = fs::temp_directory_path();
    const auto in  = (dir / "katzify-tc-in.gif").string();
    const auto out = (dir / "katzify-tc-out.gif").string();

    // input: three blobs on white, the lowest touching the bottom edge
    IndexedImage src;
    const auto art = ascii_raster({"................",
                                   "..###...........",
                                   "..###......##...",
                                   "...........##...",
                                   "................",
                                   ".......#........",
                                   ".......#........"});
    src.width   = art.width();
    src.height  = art.height();
    src.palette = art.palette();
    for(auto p : art.pixels()) src.pixels.push_back(uint8_t(p));
    write_gif(in, {src}, 10, false);

    Options opt;
    opt.input       = in;
    opt.output      = out;
    opt.frame_count = 4;
    opt.seed        = 2024;
    opt.threads     = 3;
    opt.verbose     = true;
    opt.mode        = RenderMode::Outline;

    std::stringstream log;
    render_file(opt, log);
    CATCH_REQUIRE(log.str().find("traced 3 shapes") != std::string::npos);
    CATCH_REQUIRE(log.str().find("wrote 4 frames") != std::string::npos);

    std::ifstream f(out, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    auto first = decode_gif(bytes);
    CATCH_REQUIRE(first.width() == 16);
    CATCH_REQUIRE(first.height() == 7);
    CATCH_REQUIRE(first.palette()[kBackgroundIndex] == opt.clear_color);
    CATCH_REQUIRE(first.palette()[kInkIndex] == opt.ink_color);
    CATCH_REQUIRE(first.count_other_than(kBackgroundIndex) > 0);

    // same seed, same bytes
    const auto again = (dir / "katzify-tc-again.gif").string();
    opt.output       = again;
    opt.verbose      = false;
    render_file(opt, log);
    std::ifstream g(again, std::ios::binary);
    std::vector<uint8_t> bytes2((std::istreambuf_iterator<char>(g)),
                                std::istreambuf_iterator<char>());
    CATCH_REQUIRE(bytes == bytes2);

    opt.input = (dir / "katzify-tc-missing.gif").string();
    CATCH_REQUIRE_THROWS_AS(render_file(opt, log), DecodeError);

    fs::remove(in);
    fs::remove(out);
    fs::remove(again);
}

} // namespace katzify
