#include <cstring>
#include <random>
#include <string>

#include "error.hpp"
#include "gif.hpp"

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

namespace katzify {
static IndexedImage checker_frame(int w, int h, int phase){
    IndexedImage img;
    img.width   = w;
    img.height  = h;
    img.palette = {pack_rgba(255, 255, 255), pack_rgba(0, 0, 0)};
    img.pixels.resize(size_t(w) * size_t(h));
    for(int y = 0; y < h; ++y)
        for(int x = 0; x < w; ++x)
            img.pixels[size_t(y * w + x)] = uint8_t(((x / 3 + y / 2 + phase) & 1));
    return img;
}

static size_t find_bytes(const std::vector<uint8_t>& hay, const std::string& needle){
    for(size_t i = 0; i + needle.size() <= hay.size(); ++i)
        if(std::memcmp(&hay[i], needle.data(), needle.size()) == 0) return i;
    return std::string::npos;
}

// ----------------------------------------------------------------

CATCH_TEST_CASE("GifLzw", "[gif]")
{
    CATCH_SECTION("long-random-stream-resets-dictionary"){
        // enough varied input to fill the 4096 entry table several times
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> pick(0, 15);
        std::vector<uint8_t> in(60000);
        for(auto& v : in) v = uint8_t(pick(rng));
        auto packed = lzw_encode(in, 4);
        CATCH_REQUIRE(lzw_decode(packed, 4, in.size()) == in);
    }

    CATCH_SECTION("runs-compress"){
        std::vector<uint8_t> in(10000, 1);
        auto packed = lzw_encode(in, 2);
        CATCH_REQUIRE(packed.size() < 400);
        CATCH_REQUIRE(lzw_decode(packed, 2, in.size()) == in);
    }

    CATCH_SECTION("empty"){
        auto packed = lzw_encode({}, 2);
        CATCH_REQUIRE(lzw_decode(packed, 2, 0).empty());
        CATCH_REQUIRE(lzw_decode(packed, 2, 10).empty());
    }

    CATCH_SECTION("corrupt"){
        // first code after clear must be a literal: 3-bit codes 4 (clear), 7
        const std::vector<uint8_t> bad = {0x3C, 0x00};
        CATCH_REQUIRE_THROWS_AS(lzw_decode(bad, 2, 4), DecodeError);
        CATCH_REQUIRE_THROWS_AS(lzw_decode({0x00}, 1, 4), DecodeError);
    }
}

CATCH_TEST_CASE("GifGoldenBytes", "[gif]")
{
    // 2x2, pixels 0 1 / 1 0, black and white. LZW codes at min size 2:
    // clear(4) 0 1 1 at 3 bits, then 0 eoi(5) at 4 bits once entry 8 exists
    IndexedImage img;
    img.width   = 2;
    img.height  = 2;
    img.palette = {pack_rgba(255, 255, 255), pack_rgba(0, 0, 0)};
    img.pixels  = {0, 1, 1, 0};

    const std::vector<uint8_t> expected = {
        'G',  'I',  'F',  '8',  '9',  'a',               // header
        0x02, 0x00, 0x02, 0x00, 0x80, 0x00, 0x00,       // screen, 2-entry table
        0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00,             // global color table
        0x21, 0xF9, 0x04, 0x00, 0x0A, 0x00, 0x00, 0x00, // control extension
        0x2C, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x02, 0x00, 0x00, // descriptor
        0x02,                                           // min code size
        0x03, 0x44, 0x02, 0x05, 0x00,                   // one data sub-block
        0x3B};
    CATCH_REQUIRE(lzw_encode(img.pixels, 2) == std::vector<uint8_t>{0x44, 0x02, 0x05});
    CATCH_REQUIRE(encode_gif({img}, 10, false) == expected);
}

CATCH_TEST_CASE("GifEncode", "[gif]")
{
    std::vector<IndexedImage> frames = {checker_frame(17, 11, 0),
                                        checker_frame(17, 11, 1),
                                        checker_frame(17, 11, 0)};

    CATCH_SECTION("container-layout"){
        auto bytes = encode_gif(frames, 10, true);
        CATCH_REQUIRE(std::memcmp(bytes.data(), "GIF89a", 6) == 0);
        CATCH_REQUIRE(bytes[6] == 17);
        CATCH_REQUIRE(bytes[7] == 0);
        CATCH_REQUIRE(bytes[8] == 11);
        CATCH_REQUIRE(bytes[9] == 0);
        CATCH_REQUIRE(bytes.back() == 0x3B);
        CATCH_REQUIRE(find_bytes(bytes, "NETSCAPE2.0") != std::string::npos);

        // one graphic control extension per frame, carrying the delay
        const std::string gce = {'\x21', '\xF9', '\x04', '\x00', '\x0A', '\x00'};
        size_t count = 0;
        for(size_t pos = find_bytes(bytes, gce); pos != std::string::npos;){
            ++count;
            std::vector<uint8_t> rest(bytes.begin() + long(pos) + 1, bytes.end());
            const size_t next = find_bytes(rest, gce);
            pos = next == std::string::npos ? next : pos + 1 + next;
        }
        CATCH_REQUIRE(count == 3);
    }

    CATCH_SECTION("no-loop"){
        auto bytes = encode_gif(frames, 10, false);
        CATCH_REQUIRE(find_bytes(bytes, "NETSCAPE2.0") == std::string::npos);
    }

    CATCH_SECTION("decodes-first-frame"){
        auto raster = decode_gif(encode_gif(frames, 7, true));
        CATCH_REQUIRE(raster.width() == 17);
        CATCH_REQUIRE(raster.height() == 11);
        CATCH_REQUIRE(raster.palette() == frames[0].palette);
        for(int y = 0; y < 11; ++y)
            for(int x = 0; x < 17; ++x)
                CATCH_REQUIRE(raster.color_at(x, y)
                              == frames[0].pixels[size_t(y * 17 + x)]);
    }

    CATCH_SECTION("local-color-table"){
        auto red        = checker_frame(4, 4, 0);
        red.palette[1]  = pack_rgba(255, 0, 0);
        auto bytes      = encode_gif({red, checker_frame(4, 4, 1)}, 10, false);
        // first frame sets the global table, so it decodes as red
        auto raster = decode_gif(bytes);
        CATCH_REQUIRE(raster.find_clear_color(255, 0, 0).has_value());
        CATCH_REQUIRE_THROWS_AS(encode_gif({red, checker_frame(4, 5, 0)}, 10),
                                EncodeError);
    }

    CATCH_SECTION("errors"){
        CATCH_REQUIRE_THROWS_AS(encode_gif({}, 10), EncodeError);
        CATCH_REQUIRE_THROWS_AS(encode_gif(frames, -1), EncodeError);

        auto bad = frames;
        bad[1]   = checker_frame(16, 11, 0);
        CATCH_REQUIRE_THROWS_AS(encode_gif(bad, 10), EncodeError);

        bad            = frames;
        bad[2].pixels[0] = 5;
        CATCH_REQUIRE_THROWS_AS(encode_gif(bad, 10), EncodeError);

        bad            = frames;
        bad[0].palette.clear();
        CATCH_REQUIRE_THROWS_AS(encode_gif(bad, 10), EncodeError);

        CATCH_REQUIRE_THROWS_AS(write_gif("/nonexistent-dir/out.gif", frames, 10),
                                EncodeError);
    }
}

CATCH_TEST_CASE("GifDecode", "[gif]")
{
    CATCH_SECTION("interlaced"){
        // encode rows in interlaced order, then set the interlace flag
        auto natural = checker_frame(5, 10, 0);
        for(int y = 0; y < 10; ++y) natural.pixels[size_t(y * 5)] = uint8_t(y & 1);
        const int order[10] = {0, 8, 4, 2, 6, 1, 3, 5, 7, 9};
        auto stored = natural;
        for(int i = 0; i < 10; ++i)
            for(int x = 0; x < 5; ++x)
                stored.pixels[size_t(i * 5 + x)] = natural.pixels[size_t(order[i] * 5 + x)];

        auto bytes = encode_gif({stored}, 10, false);
        // header 6 + screen 7 + 2 color table entries 6 + control extension 8
        const size_t descriptor = 27;
        CATCH_REQUIRE(bytes[descriptor] == 0x2C);
        bytes[descriptor + 9] |= 0x40;

        auto raster = decode_gif(bytes);
        for(int y = 0; y < 10; ++y)
            for(int x = 0; x < 5; ++x)
                CATCH_REQUIRE(raster.color_at(x, y) == natural.pixels[size_t(y * 5 + x)]);
    }

    CATCH_SECTION("oversized-screen"){
        // 65535x65535 logical screen holding a single 1x1 image
        const std::vector<uint8_t> huge = {
            'G', 'I', 'F', '8', '9', 'a', 0xFF, 0xFF, 0xFF, 0xFF, 0x80, 0x00,
            0x00, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x2C, 0x00, 0x00, 0x00,
            0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x02, 0x44, 0x01, 0x00,
            0x3B};
        CATCH_REQUIRE(huge.size() == 35);
        CATCH_REQUIRE_THROWS_AS(decode_gif(huge), DecodeError);

        // same image on a 1x1 screen decodes
        auto small = huge;
        small[6] = 1; small[7] = 0; small[8] = 1; small[9] = 0;
        auto raster = decode_gif(small);
        CATCH_REQUIRE(raster.width() == 1);
        CATCH_REQUIRE(raster.color_at(0, 0) == 0);

        // image descriptor reaching past the limit
        auto far = small;
        far[24] = 0xFF; far[25] = 0xFF; far[26] = 0xFF; far[27] = 0xFF;
        CATCH_REQUIRE_THROWS_AS(decode_gif(far), DecodeError);
    }

    CATCH_SECTION("bad-input"){
        CATCH_REQUIRE_THROWS_AS(decode_gif({}), DecodeError);
        const std::string png_sig = "\x89PNG\r\n\x1a\n";
        CATCH_REQUIRE_THROWS_AS(
            decode_gif(std::vector<uint8_t>(png_sig.begin(), png_sig.end())),
            DecodeError);

        auto bytes = encode_gif({checker_frame(8, 8, 0)}, 10);
        bytes.resize(bytes.size() / 2);
        CATCH_REQUIRE_THROWS_AS(decode_gif(bytes), DecodeError);
    }
}

} // namespace katzify
