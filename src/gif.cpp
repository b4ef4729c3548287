#include "gif.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unordered_map>

using namespace std;

namespace katzify {

static const int MAX_CODE_LEN = 12;            // maximum code length for lzw
static const int MAX_DICT_LEN = 1 << MAX_CODE_LEN;

// ---------------------- LZW ----------------------
namespace {

// packs variable-width codes LSB first
struct BitWriter {
    vector<uint8_t> out;
    uint32_t acc = 0;
    int nbits = 0;
    void put(uint32_t code, int width){
        acc |= code << nbits;
        nbits += width;
        while(nbits >= 8){
            out.push_back((uint8_t)(acc & 0xFF));
            acc >>= 8;
            nbits -= 8;
        }
    }
    void flush(){
        if(nbits > 0) out.push_back((uint8_t)(acc & 0xFF));
        acc = 0; nbits = 0;
    }
};

struct BitReader {
    const vector<uint8_t> &in;
    size_t pos = 0;
    uint32_t acc = 0;
    int nbits = 0;
    explicit BitReader(const vector<uint8_t> &data) : in(data) {}
    // false when the stream runs dry
    bool get(int width, int &code){
        while(nbits < width){
            if(pos >= in.size()) return false;
            acc |= (uint32_t)in[pos++] << nbits;
            nbits += 8;
        }
        code = (int)(acc & ((1u << width) - 1));
        acc >>= width;
        nbits -= width;
        return true;
    }
};

} // namespace

vector<uint8_t> lzw_encode(const vector<uint8_t> &indices, int min_code_size)
{
    const int clear_code = 1 << min_code_size;
    const int eoi_code = clear_code + 1;
    int code_size = min_code_size + 1;
    int next_code = eoi_code + 1;
    unordered_map<uint32_t,int> dict;   // (prefix << 8 | index) -> code
    dict.reserve(MAX_DICT_LEN);

    BitWriter bw;
    bw.put(clear_code, code_size);
    if(indices.empty()){
        bw.put(eoi_code, code_size);
        bw.flush();
        return bw.out;
    }

    int prefix = indices[0];
    for(size_t i=1;i<indices.size();++i){
        uint8_t c = indices[i];
        uint32_t key = ((uint32_t)prefix << 8) | c;
        auto it = dict.find(key);
        if(it != dict.end()){
            prefix = it->second;
            continue;
        }
        bw.put(prefix, code_size);
        if(next_code < MAX_DICT_LEN){
            dict[key] = next_code++;
            if(next_code > (1 << code_size) && code_size < MAX_CODE_LEN) ++code_size;
        } else {
            // dictionary full, start over
            bw.put(clear_code, code_size);
            dict.clear();
            code_size = min_code_size + 1;
            next_code = eoi_code + 1;
        }
        prefix = c;
    }
    bw.put(prefix, code_size);
    bw.put(eoi_code, code_size);
    bw.flush();
    return bw.out;
}

vector<uint8_t> lzw_decode(const vector<uint8_t> &data, int min_code_size, size_t max_pixels)
{
    if(min_code_size < 2 || min_code_size > 8) throw DecodeError("bad lzw minimum code size " + to_string(min_code_size));
    const int clear_code = 1 << min_code_size;
    const int eoi_code = clear_code + 1;
    int code_size = min_code_size + 1;
    int next_code = eoi_code + 1;

    array<uint16_t, MAX_DICT_LEN> prefix{};
    array<uint8_t, MAX_DICT_LEN> suffix{};
    array<uint8_t, MAX_DICT_LEN> first{};
    for(int i=0;i<clear_code;++i){ suffix[i] = (uint8_t)i; first[i] = (uint8_t)i; }

    vector<uint8_t> out;
    out.reserve(min(max_pixels, kMaxPixels));
    vector<uint8_t> stack;
    auto emit = [&](int code){
        stack.clear();
        while(code >= clear_code){
            stack.push_back(suffix[code]);
            code = prefix[code];
        }
        stack.push_back((uint8_t)code);
        for(auto it = stack.rbegin(); it != stack.rend() && out.size() < max_pixels; ++it) out.push_back(*it);
    };

    BitReader br(data);
    int prev = -1;
    int code;
    while(out.size() < max_pixels && br.get(code_size, code)){
        if(code == clear_code){
            code_size = min_code_size + 1;
            next_code = eoi_code + 1;
            prev = -1;
            continue;
        }
        if(code == eoi_code) break;
        if(prev < 0){
            if(code > clear_code) throw DecodeError("corrupt lzw stream");
            emit(code);
            prev = code;
            continue;
        }
        uint8_t head;
        if(code < next_code) head = first[code];
        else if(code == next_code) head = first[prev];
        else throw DecodeError("corrupt lzw stream");

        if(next_code < MAX_DICT_LEN){
            prefix[next_code] = (uint16_t)prev;
            suffix[next_code] = head;
            first[next_code] = first[prev];
            ++next_code;
            if(next_code == (1 << code_size) && code_size < MAX_CODE_LEN) ++code_size;
        }
        emit(code);
        prev = code;
    }
    return out;
}

// ---------------------- GIF writing ----------------------
static inline void put16(vector<uint8_t> &out, int v){
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)((v >> 8) & 0xFF));
}

// smallest s >= 1 with 2^s >= n
static int table_bits(size_t n){
    int s = 1;
    while((size_t(1) << s) < n) ++s;
    return s;
}

static void put_color_table(vector<uint8_t> &out, const vector<uint32_t> &palette, int bits){
    for(int i=0;i<(1 << bits);++i){
        int r=0,g=0,b=0,a=0;
        if((size_t)i < palette.size()) unpack_rgba(palette[i], r,g,b,a);
        out.push_back((uint8_t)r); out.push_back((uint8_t)g); out.push_back((uint8_t)b);
    }
}

vector<uint8_t> encode_gif(const vector<IndexedImage> &frames, int delay_cs, bool loop)
{
    if(frames.empty()) throw EncodeError("no frames to encode");
    if(delay_cs < 0 || delay_cs > 0xFFFF) throw EncodeError("frame delay out of range: " + to_string(delay_cs));
    const IndexedImage &f0 = frames.front();
    if(f0.width < 0 || f0.height < 0 || f0.width > 0xFFFF || f0.height > 0xFFFF)
        throw EncodeError("frame size out of range for gif");

    for(size_t i=0;i<frames.size();++i){
        const IndexedImage &f = frames[i];
        if(f.width != f0.width || f.height != f0.height)
            throw EncodeError("frame " + to_string(i) + " size differs from first frame");
        if(f.palette.empty() || f.palette.size() > 256)
            throw EncodeError("frame " + to_string(i) + " palette must have 1..256 colors");
        if(f.pixels.size() != (size_t)f.width * f.height)
            throw EncodeError("frame " + to_string(i) + " pixel buffer is the wrong size");
        for(uint8_t p : f.pixels){
            if(p >= f.palette.size()) throw EncodeError("frame " + to_string(i) + " uses color outside its palette");
        }
    }

    vector<uint8_t> out;
    const char sig[] = "GIF89a";
    out.insert(out.end(), sig, sig + 6);

    // logical screen descriptor + global color table
    int gbits = table_bits(f0.palette.size());
    put16(out, f0.width);
    put16(out, f0.height);
    out.push_back((uint8_t)(0x80 | ((gbits - 1) << 4) | (gbits - 1)));
    out.push_back(0);   // background color index
    out.push_back(0);   // pixel aspect ratio
    put_color_table(out, f0.palette, gbits);

    if(loop){
        out.push_back(0x21); out.push_back(0xFF); out.push_back(0x0B);
        const char app[] = "NETSCAPE2.0";
        out.insert(out.end(), app, app + 11);
        out.push_back(0x03); out.push_back(0x01);
        put16(out, 0);      // loop forever
        out.push_back(0x00);
    }

    for(auto &f : frames){
        // graphic control extension: no disposal, no transparency
        out.push_back(0x21); out.push_back(0xF9); out.push_back(0x04);
        out.push_back(0x00);
        put16(out, delay_cs);
        out.push_back(0x00);
        out.push_back(0x00);

        bool local = f.palette != f0.palette;
        int bits = local ? table_bits(f.palette.size()) : gbits;
        out.push_back(0x2C);
        put16(out, 0); put16(out, 0);
        put16(out, f.width); put16(out, f.height);
        out.push_back(local ? (uint8_t)(0x80 | (bits - 1)) : (uint8_t)0x00);
        if(local) put_color_table(out, f.palette, bits);

        int min_code_size = max(2, bits);
        out.push_back((uint8_t)min_code_size);
        vector<uint8_t> data = lzw_encode(f.pixels, min_code_size);
        for(size_t pos=0; pos<data.size(); pos+=255){
            size_t len = min<size_t>(255, data.size() - pos);
            out.push_back((uint8_t)len);
            out.insert(out.end(), data.begin() + pos, data.begin() + pos + len);
        }
        out.push_back(0x00);
    }
    out.push_back(0x3B);
    return out;
}

void write_gif(const string &path, const vector<IndexedImage> &frames, int delay_cs, bool loop)
{
    vector<uint8_t> bytes = encode_gif(frames, delay_cs, loop);
    FILE *fp = fopen(path.c_str(), "wb");
    if(!fp) throw EncodeError("could not open " + path + " for writing: " + strerror(errno));
    size_t n = fwrite(bytes.data(), 1, bytes.size(), fp);
    bool ok = n == bytes.size();
    if(fclose(fp) != 0) ok = false;
    if(!ok) throw EncodeError("short write to " + path);
}

// ---------------------- GIF reading ----------------------
namespace {

struct ByteReader {
    const vector<uint8_t> &in;
    size_t pos = 0;
    explicit ByteReader(const vector<uint8_t> &data) : in(data) {}
    void need(size_t n) const {
        if(pos + n > in.size()) throw DecodeError("truncated gif");
    }
    uint8_t u8(){ need(1); return in[pos++]; }
    int u16(){ need(2); int v = in[pos] | (in[pos+1] << 8); pos += 2; return v; }
    void skip(size_t n){ need(n); pos += n; }
    // concatenated data sub-blocks up to the zero terminator
    vector<uint8_t> sub_blocks(){
        vector<uint8_t> data;
        while(true){
            uint8_t len = u8();
            if(len == 0) break;
            need(len);
            data.insert(data.end(), in.begin() + pos, in.begin() + pos + len);
            pos += len;
        }
        return data;
    }
    vector<uint32_t> color_table(int bits){
        vector<uint32_t> table(size_t(1) << bits);
        for(auto &c : table){
            int r = u8(), g = u8(), b = u8();
            c = pack_rgba(r,g,b);
        }
        return table;
    }
};

} // namespace

Raster decode_gif(const vector<uint8_t> &bytes)
{
    ByteReader rd(bytes);
    rd.need(6);
    if(memcmp(bytes.data(), "GIF87a", 6) != 0 && memcmp(bytes.data(), "GIF89a", 6) != 0)
        throw DecodeError("not a gif file");
    rd.skip(6);

    int screen_w = rd.u16();
    int screen_h = rd.u16();
    if((size_t)screen_w * screen_h > kMaxPixels)
        throw DecodeError("gif screen " + to_string(screen_w) + "x" + to_string(screen_h) + " is too large");
    uint8_t flags = rd.u8();
    int bg_index = rd.u8();
    rd.skip(1);
    vector<uint32_t> global;
    if(flags & 0x80) global = rd.color_table((flags & 0x07) + 1);

    while(true){
        uint8_t block = rd.u8();
        if(block == 0x3B) break;
        if(block == 0x21){
            rd.skip(1);     // label
            rd.sub_blocks();
            continue;
        }
        if(block != 0x2C) throw DecodeError("unexpected gif block " + to_string((int)block));

        int left = rd.u16(), top = rd.u16();
        int iw = rd.u16(), ih = rd.u16();
        uint8_t iflags = rd.u8();
        int w = max(screen_w, left + iw), h = max(screen_h, top + ih);
        if((size_t)w * h > kMaxPixels)
            throw DecodeError("gif image " + to_string(w) + "x" + to_string(h) + " is too large");
        vector<uint32_t> palette = global;
        if(iflags & 0x80) palette = rd.color_table((iflags & 0x07) + 1);
        if(palette.empty()) throw DecodeError("gif image has no color table");
        bool interlaced = (iflags & 0x40) != 0;

        int min_code_size = rd.u8();
        vector<uint8_t> data = rd.sub_blocks();
        size_t count = (size_t)iw * ih;
        vector<uint8_t> idx = lzw_decode(data, min_code_size, count);
        if(idx.size() < count) throw DecodeError("gif image data ends early");

        if(bg_index >= (int)palette.size()) bg_index = 0;
        Raster raster(w, h, palette, (ColorIndex)bg_index);

        // row order of an interlaced image: every 8th from 0, every 8th from 4,
        // every 4th from 2, every 2nd from 1
        vector<int> rows;
        rows.reserve(ih);
        if(interlaced){
            static const int start[4] = {0, 4, 2, 1};
            static const int stride[4] = {8, 8, 4, 2};
            for(int pass=0;pass<4;++pass)
                for(int r=start[pass]; r<ih; r+=stride[pass]) rows.push_back(r);
        } else {
            for(int r=0;r<ih;++r) rows.push_back(r);
        }
        for(int i=0;i<ih;++i){
            int y = top + rows[i];
            for(int x=0;x<iw;++x) raster.set_color(left + x, y, idx[(size_t)i * iw + x]);
        }
        return raster;
    }
    throw DecodeError("gif contains no image");
}

} // namespace katzify
