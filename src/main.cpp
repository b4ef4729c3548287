/*main.cpp
// katzify: turn a still image into a looping "shaky line" animated GIF.
// Requires libpng and libjpeg: sudo apt update && sudo apt install libpng-dev libjpeg-dev
// Build: cmake -S . -B build && cmake --build build
// Usage: katzify [options] INPUT.{gif,png,jpg} OUTPUT.gif
*/

#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "error.hpp"
#include "image_io.hpp"
#include "katzify.hpp"

using namespace std;
using namespace katzify;

static void usage(const char *argv0){
    cerr << "Usage: " << argv0 << " [options] INPUT OUTPUT\n"
         << "  -s SLOPPINESS   fraction of points dropped per frame (default 0.1)\n"
         << "  -k SHAKINESS    max jitter in pixels (default 1)\n"
         << "  -f FREQ         probability a point is jittered (default 0.25)\n"
         << "  -n FRAMES       number of frames (default 5)\n"
         << "  -b RADIUS       erosion blot radius (default 1)\n"
         << "  -d DELAY        frame delay in 1/100 s (default 10)\n"
         << "  -c RRGGBB       background color to trace against (default ffffff)\n"
         << "  -i RRGGBB       ink color (default 000000)\n"
         << "  --outline       draw outlines instead of filled shapes\n"
         << "  --no-loop       play the animation once\n"
         << "  --seed N        random seed (default: random)\n"
         << "  -j THREADS      number of worker threads (default hardware concurrency)\n"
         << "  -v, --verbose   progress on stderr\n";
}

// ---------------------- Main flow ----------------------
int main(int argc, char** argv){
    Options opt;
    opt.threads = thread::hardware_concurrency() ? (int)thread::hardware_concurrency() : 4;
    bool seeded = false;
    vector<string> args;

    try {
        for(int i=1;i<argc;++i){
            string s = argv[i];
            auto value = [&]()->string{
                if(i+1 >= argc) throw InvalidParameterError("missing value for " + s);
                return argv[++i];
            };
            if(s=="-s" || s=="--sloppiness") opt.sloppiness = parse_double(s, value());
            else if(s=="-k" || s=="--shakiness") opt.shakiness = parse_int(s, value());
            else if(s=="-f" || s=="--shaky-freq") opt.shaky_freq = parse_double(s, value());
            else if(s=="-n" || s=="--frames") opt.frame_count = parse_int(s, value());
            else if(s=="-b" || s=="--blot") opt.blot_radius = parse_int(s, value());
            else if(s=="-d" || s=="--delay") opt.delay = parse_int(s, value());
            else if(s=="-c" || s=="--clear") opt.clear_color = parse_hex_color(value());
            else if(s=="-i" || s=="--ink") opt.ink_color = parse_hex_color(value());
            else if(s=="--outline") opt.mode = RenderMode::Outline;
            else if(s=="--no-loop") opt.loop = false;
            else if(s=="--seed"){ opt.seed = parse_u64(s, value()); seeded = true; }
            else if(s=="-j" || s=="--jobs") opt.threads = parse_int(s, value());
            else if(s=="-v" || s=="--verbose") opt.verbose = true;
            else if(s=="-h" || s=="--help"){ usage(argv[0]); return 0; }
            else args.push_back(s);
        }
    } catch(const Error &e){
        cerr << "katzify: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    if(args.size()!=2){
        usage(argv[0]);
        return 1;
    }
    opt.input = args[0];
    opt.output = args[1];
    if(!seeded){
        random_device rd;
        opt.seed = ((uint64_t)rd() << 32) | rd();
    }
    if(opt.verbose) cerr << "seed " << opt.seed << "\n";

    try {
        render_file(opt, cerr);
    } catch(const Error &e){
        cerr << "katzify: " << e.what() << "\n";
        return 1;
    } catch(const exception &e){
        cerr << "katzify: internal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
