#include "katzify.hpp"
#include "error.hpp"
#include "gif.hpp"
#include "image_io.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace std;

namespace katzify {

// ---------------------- Option parsing ----------------------
template <typename T, typename F>
static T parse_number(const string &flag, const string &s, F conv){
    try {
        size_t used = 0;
        T v = conv(s, &used);
        if(used == s.size()) return v;
    } catch(const std::logic_error &){
        // invalid_argument / out_of_range fall through
    }
    throw InvalidParameterError("bad value for " + flag + ": '" + s + "'");
}

double parse_double(const string &flag, const string &s){
    return parse_number<double>(flag, s, [](const string &v, size_t *n){ return stod(v, n); });
}
int parse_int(const string &flag, const string &s){
    return parse_number<int>(flag, s, [](const string &v, size_t *n){ return stoi(v, n); });
}
uint64_t parse_u64(const string &flag, const string &s){
    // stoull accepts "-1" and wraps it
    if(s.empty() || !isdigit((unsigned char)s[0])) throw InvalidParameterError("bad value for " + flag + ": '" + s + "'");
    return parse_number<uint64_t>(flag, s, [](const string &v, size_t *n){ return (uint64_t)stoull(v, n); });
}

AnimatorParams animator_params(const Options &opt)
{
    AnimatorParams p;
    p.sloppiness = opt.sloppiness;
    p.shakiness = opt.shakiness;
    p.shaky_freq = opt.shaky_freq;
    p.frame_count = opt.frame_count;
    p.seed = opt.seed;
    p.threads = opt.threads;
    return p;
}

ColorIndex resolve_clear_color(const Raster &raster, const Options &opt)
{
    int r,g,b,a;
    unpack_rgba(opt.clear_color, r,g,b,a);
    auto clear = raster.find_clear_color(r,g,b);
    if(!clear){
        stringstream ss;
        ss << "clear color #" << hex << setfill('0')
           << setw(2) << r << setw(2) << g << setw(2) << b << " not found in image palette";
        throw NoClearColorError(ss.str());
    }
    return *clear;
}

vector<IndexedImage> render_frames(const Raster &raster, const Options &opt, ostream &log)
{
    AnimatorParams params = animator_params(opt);
    validate(params);
    ColorIndex clear = resolve_clear_color(raster, opt);

    ShapeList shapes = trace_image(raster, clear, opt.blot_radius);
    if(opt.verbose){
        size_t points = 0;
        for(auto &s : shapes) points += s.size();
        log << "traced " << shapes.size() << " shapes, " << points << " points\n";
    }

    Animation animation = animate(shapes, params);

    // rasterize frames (parallel)
    int w = raster.width(), h = raster.height();
    vector<IndexedImage> images(animation.size());
    atomic<size_t> next_frame(0);
    auto worker = [&](){
        while(true){
            size_t f = next_frame.fetch_add(1);
            if(f >= animation.size()) break;
            images[f] = render_frame(w, h, animation[f], opt.ink_color, opt.clear_color, opt.mode);
        }
    };
    int threads = max(1, min(opt.threads, (int)animation.size()));
    vector<thread> pool;
    for(int i=0;i<threads;++i) pool.emplace_back(worker);
    for(auto &t : pool) t.join();
    return images;
}

void render_file(const Options &opt, ostream &log)
{
    Raster raster = load_raster(opt.input);
    if(opt.verbose) log << "loaded " << opt.input << " (" << raster.width() << "x" << raster.height()
                        << ", " << raster.palette().size() << " colors)\n";

    vector<IndexedImage> frames = render_frames(raster, opt, log);
    write_gif(opt.output, frames, opt.delay, opt.loop);
    if(opt.verbose) log << "wrote " << frames.size() << " frames to " << opt.output << "\n";
}

} // namespace katzify
