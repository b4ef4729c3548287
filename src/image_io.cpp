#include "image_io.hpp"
#include "error.hpp"
#include "gif.hpp"

#include <png.h>
#include <jpeglib.h>

#include <algorithm>
#include <cctype>
#include <csetjmp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <new>
#include <stdexcept>
#include <unordered_map>
#include <utility>

using namespace std;

namespace katzify {

// ---------------------- PNG loader (libpng) ----------------------
bool load_png_rgba(const string &filename, int &width, int &height, vector<unsigned char> &out_rgba){
    FILE *fp = fopen(filename.c_str(), "rb");
    if(!fp) return false;
    unsigned char sig[8];
    if(fread(sig, 1, 8, fp) != 8 || png_sig_cmp(sig, 0, 8) != 0){ fclose(fp); return false; }
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if(!png_ptr){ fclose(fp); return false; }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if(!info_ptr){ png_destroy_read_struct(&png_ptr,(png_infopp)0,(png_infopp)0); fclose(fp); return false; }
    vector<unsigned char> img;
    vector<png_bytep> rows;
    if(setjmp(png_jmpbuf(png_ptr))){ png_destroy_read_struct(&png_ptr,&info_ptr,(png_infopp)0); fclose(fp); return false; }
    png_init_io(png_ptr, fp);
    png_set_sig_bytes(png_ptr, 8);
    png_read_info(png_ptr, info_ptr);
    width = png_get_image_width(png_ptr, info_ptr);
    height = png_get_image_height(png_ptr, info_ptr);
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth  = png_get_bit_depth(png_ptr, info_ptr);
    if((size_t)width * height > kMaxPixels){ png_destroy_read_struct(&png_ptr,&info_ptr,(png_infopp)0); fclose(fp); return false; }
    // conversions to 8-bit RGBA
    if(bit_depth == 16) png_set_strip_16(png_ptr);
    if(color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if(color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    if(png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png_ptr);
    if(color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_PALETTE)
        png_set_add_alpha(png_ptr, 0xFF, PNG_FILLER_AFTER);
    if(color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    rows.resize(height);
    img.resize((size_t)width * height * 4);
    for(int y=0;y<height;++y) rows[y] = (png_bytep)(img.data() + (size_t)y * width * 4);
    png_read_image(png_ptr, rows.data());
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);
    out_rgba.swap(img);
    return true;
}

// ---------------------- JPEG loader (libjpeg) ----------------------
namespace {

struct JpegError {
    jpeg_error_mgr pub;
    jmp_buf jump;
};

void jpeg_error_exit(j_common_ptr cinfo){
    longjmp(((JpegError *)cinfo->err)->jump, 1);
}

void jpeg_silent(j_common_ptr, int){}

} // namespace

bool load_jpeg_rgba(const string &filename, int &width, int &height, vector<unsigned char> &out_rgba){
    FILE *fp = fopen(filename.c_str(), "rb");
    if(!fp) return false;
    jpeg_decompress_struct cinfo;
    JpegError jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.emit_message = jpeg_silent;
    vector<unsigned char> img;
    vector<unsigned char> row;
    if(setjmp(jerr.jump)){ jpeg_destroy_decompress(&cinfo); fclose(fp); return false; }
    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    jpeg_read_header(&cinfo, TRUE);
    // grayscale is widened by hand below, everything else through libjpeg
    if(cinfo.jpeg_color_space != JCS_GRAYSCALE) cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    width = (int)cinfo.output_width;
    height = (int)cinfo.output_height;
    int comps = cinfo.output_components;
    if((comps != 1 && comps != 3) || (size_t)width * height > kMaxPixels){
        jpeg_destroy_decompress(&cinfo); fclose(fp); return false;
    }
    img.resize((size_t)width * height * 4);
    row.resize((size_t)width * comps);
    while(cinfo.output_scanline < cinfo.output_height){
        size_t y = cinfo.output_scanline;
        JSAMPROW rows[1] = { row.data() };
        jpeg_read_scanlines(&cinfo, rows, 1);
        unsigned char *dst = img.data() + y * width * 4;
        for(int x=0;x<width;++x){
            const unsigned char *src = row.data() + (size_t)x * comps;
            dst[x*4+0] = src[0];
            dst[x*4+1] = comps == 3 ? src[1] : src[0];
            dst[x*4+2] = comps == 3 ? src[2] : src[0];
            dst[x*4+3] = 0xFF;
        }
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    fclose(fp);
    out_rgba.swap(img);
    return true;
}

Raster index_rgba(int width, int height, const vector<unsigned char> &rgba)
{
    if(rgba.size() != (size_t)width * height * 4) throw DecodeError("rgba buffer does not match image size");
    vector<uint32_t> palette;
    vector<ColorIndex> pixels((size_t)width * height);
    unordered_map<uint32_t,ColorIndex> index_of;
    for(size_t i=0;i<pixels.size();++i){
        uint32_t c = pack_rgba(&rgba[i*4]);
        auto it = index_of.find(c);
        if(it == index_of.end()){
            it = index_of.emplace(c, (ColorIndex)palette.size()).first;
            palette.push_back(c);
        }
        pixels[i] = it->second;
    }
    return Raster(width, height, move(palette), move(pixels));
}

static string extension_of(const string &path){
    auto slash = path.find_last_of("/\\");
    auto dot = path.find_last_of('.');
    if(dot == string::npos || (slash != string::npos && dot < slash)) return "";
    string ext = path.substr(dot + 1);
    transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return (char)tolower(c); });
    return ext;
}

static Raster decode_by_extension(const string &path, ifstream &in)
{
    string ext = extension_of(path);
    if(ext == "png" || ext == "jpg" || ext == "jpeg"){
        in.close();
        bool png = ext == "png";
        int w, h;
        vector<unsigned char> raw;
        bool ok = png ? load_png_rgba(path, w, h, raw) : load_jpeg_rgba(path, w, h, raw);
        if(!ok) throw DecodeError(string("Could not decode ") + (png ? "png" : "jpeg") + " image: " + path);
        return index_rgba(w, h, raw);
    }

    // default to gif
    vector<uint8_t> bytes((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    try {
        return decode_gif(bytes);
    } catch(const DecodeError &e){
        throw DecodeError(path + ": " + e.what());
    }
}

Raster load_raster(const string &path)
{
    ifstream in(path, ios::binary);
    if(!in) throw DecodeError("Image at " + path + " is not readable.");
    try {
        return decode_by_extension(path, in);
    } catch(const bad_alloc &){
        throw DecodeError("Image at " + path + " is too large to load.");
    } catch(const length_error &){
        throw DecodeError("Image at " + path + " is too large to load.");
    }
}

uint32_t parse_hex_color(const string &s)
{
    string hex = (!s.empty() && s[0] == '#') ? s.substr(1) : s;
    if(hex.size() != 6 || !all_of(hex.begin(), hex.end(), [](unsigned char c){ return isxdigit(c) != 0; }))
        throw InvalidParameterError("expected a color as RRGGBB, got '" + s + "'");
    uint32_t rgb = (uint32_t)stoul(hex, nullptr, 16);
    return (rgb << 8) | 0xFF;
}

} // namespace katzify
