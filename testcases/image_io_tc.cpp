#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include <png.h>
#include <cstdio>
#include <jpeglib.h>

#include "error.hpp"
#include "gif.hpp"
#include "image_io.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace fs = std::filesystem;

namespace katzify {
static std::string temp_path(const std::string& name){
    return (fs::temp_directory_path() / ("katzify-tc-" + name)).string();
}

static bool write_png_rgba(const std::string& path, int w, int h,
                           const std::vector<unsigned char>& rgba){
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width   = png_uint_32(w);
    image.height  = png_uint_32(h);
    image.format  = PNG_FORMAT_RGBA;
    return png_image_write_to_file(&image, path.c_str(), 0, rgba.data(), 0, nullptr) != 0;
}

// 8-bit grayscale or RGB samples, row-major
static bool write_jpeg(const std::string& path, int w, int h, int components,
                       const std::vector<unsigned char>& samples){
    FILE* fp = std::fopen(path.c_str(), "wb");
    if(!fp) return false;
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, fp);
    cinfo.image_width      = JDIMENSION(w);
    cinfo.image_height     = JDIMENSION(h);
    cinfo.input_components = components;
    cinfo.in_color_space   = components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 100, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    while(cinfo.next_scanline < cinfo.image_height){
        JSAMPROW row = const_cast<unsigned char*>(
            &samples[size_t(cinfo.next_scanline) * size_t(w * components)]);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return std::fclose(fp) == 0;
}

// ----------------------------------------------------------------

CATCH_TEST_CASE("IndexRgba", "[image_io]")
{
    // 3x2: white black white / red black black
    const std::vector<unsigned char> rgba = {
        255, 255, 255, 255, 0,   0, 0, 255, 255, 255, 255, 255,
        255, 0,   0,   255, 0,   0, 0, 255, 0,   0,   0,   255};
    auto r = index_rgba(3, 2, rgba);
    CATCH_REQUIRE(r.palette()
                  == std::vector<uint32_t>{pack_rgba(255, 255, 255),
                                           pack_rgba(0, 0, 0),
                                           pack_rgba(255, 0, 0)});
    CATCH_REQUIRE(r.pixels() == std::vector<ColorIndex>{0, 1, 0, 2, 1, 1});
    CATCH_REQUIRE_THROWS_AS(index_rgba(4, 2, rgba), DecodeError);
}

CATCH_TEST_CASE("ParseHexColor", "[image_io]")
{
    CATCH_REQUIRE(parse_hex_color("ffffff") == 0xFFFFFFFFu);
    CATCH_REQUIRE(parse_hex_color("#FF0000") == 0xFF0000FFu);
    CATCH_REQUIRE(parse_hex_color("000000") == 0x000000FFu);
    CATCH_REQUIRE_THROWS_AS(parse_hex_color("fff"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_hex_color("gg0000"), InvalidParameterError);
    CATCH_REQUIRE_THROWS_AS(parse_hex_color(""), InvalidParameterError);
}

CATCH_TEST_CASE("LoadRaster", "[image_io]")
{
    CATCH_SECTION("missing-file"){
        CATCH_REQUIRE_THROWS_AS(load_raster(temp_path("does-not-exist.gif")),
                                DecodeError);
    }

    CATCH_SECTION("png"){
        const auto path = temp_path("load.png");
        std::vector<unsigned char> rgba;
        for(int y = 0; y < 4; ++y)
            for(int x = 0; x < 5; ++x){
                const unsigned char v = (x == 2 && y == 1) ? 0 : 255;
                rgba.insert(rgba.end(), {v, v, v, 255});
            }
        CATCH_REQUIRE(write_png_rgba(path, 5, 4, rgba));

        auto r = load_raster(path);
        CATCH_REQUIRE(r.width() == 5);
        CATCH_REQUIRE(r.height() == 4);
        const auto white = r.find_clear_color(255, 255, 255);
        CATCH_REQUIRE(white.has_value());
        CATCH_REQUIRE(r.count_other_than(*white) == 1);
        CATCH_REQUIRE(r.color_at(2, 1) != *white);
        fs::remove(path);
    }

    CATCH_SECTION("jpeg"){
        // 16x8: black 8x8 block left, white right; lossy, so compare loosely
        std::vector<unsigned char> gray;
        for(int y = 0; y < 8; ++y)
            for(int x = 0; x < 16; ++x) gray.push_back(x < 8 ? 0 : 255);

        for(const std::string name : {"load.jpg", "load.JPEG"}){
            const auto path = temp_path(name);
            CATCH_REQUIRE(write_jpeg(path, 16, 8, 1, gray));
            auto r = load_raster(path);
            CATCH_REQUIRE(r.width() == 16);
            CATCH_REQUIRE(r.height() == 8);
            int cr, cg, cb, ca;
            unpack_rgba(r.palette()[size_t(r.color_at(2, 3))], cr, cg, cb, ca);
            CATCH_REQUIRE(cr < 16);
            CATCH_REQUIRE((cr == cg && cg == cb && ca == 255));
            unpack_rgba(r.palette()[size_t(r.color_at(13, 3))], cr, cg, cb, ca);
            CATCH_REQUIRE(cr > 239);
            CATCH_REQUIRE((cr == cg && cg == cb && ca == 255));
            fs::remove(path);
        }

        std::vector<unsigned char> rgb;
        for(int i = 0; i < 8 * 8; ++i) rgb.insert(rgb.end(), {200, 40, 40});
        const auto path = temp_path("load-rgb.jpg");
        CATCH_REQUIRE(write_jpeg(path, 8, 8, 3, rgb));
        auto r = load_raster(path);
        int cr, cg, cb, ca;
        unpack_rgba(r.palette()[size_t(r.color_at(4, 4))], cr, cg, cb, ca);
        CATCH_REQUIRE(cr > cg + 100);
        CATCH_REQUIRE(ca == 255);
        fs::remove(path);
    }

    CATCH_SECTION("gif-and-default-extension"){
        IndexedImage img;
        img.width   = 6;
        img.height  = 3;
        img.palette = {pack_rgba(255, 255, 255), pack_rgba(0, 0, 0)};
        img.pixels  = {0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 0, 0, 0, 0, 0, 0, 0, 1};

        for(const std::string name : {"load.gif", "load.GIF", "load.img"}){
            const auto path = temp_path(name);
            write_gif(path, {img}, 10);
            auto r = load_raster(path);
            CATCH_REQUIRE(r.width() == 6);
            CATCH_REQUIRE(r.height() == 3);
            CATCH_REQUIRE(r.count_other_than(0) == 4);
            CATCH_REQUIRE(r.color_at(5, 2) == 1);
            fs::remove(path);
        }
    }

    CATCH_SECTION("wrong-content"){
        const auto path = temp_path("not-really.png");
        {
            std::ofstream out(path, std::ios::binary);
            out << "GIF89a but not a png";
        }
        CATCH_REQUIRE_THROWS_AS(load_raster(path), DecodeError);
        fs::remove(path);

        const auto jpg = temp_path("photo.jpg");
        {
            std::ofstream out(jpg, std::ios::binary);
            out << "\xFF\xD8\xFF";
        }
        CATCH_REQUIRE_THROWS_AS(load_raster(jpg), DecodeError);
        fs::remove(jpg);
    }
}

} // namespace katzify
