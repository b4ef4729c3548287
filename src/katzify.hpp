#ifndef KATZIFY_KATZIFY_HPP
#define KATZIFY_KATZIFY_HPP

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "animator.hpp"
#include "raster.hpp"
#include "render.hpp"
#include "tracer.hpp"

namespace katzify {

struct Options {
    double sloppiness = 0.1;
    int shakiness = 1;
    double shaky_freq = 0.25;
    int frame_count = 5;
    int blot_radius = kDefaultBlotRadius;
    int delay = 10;                     // centiseconds per frame
    bool loop = true;
    RenderMode mode = RenderMode::Filled;
    uint32_t clear_color = 0xFFFFFFFFu; // white, packed RGBA
    uint32_t ink_color = 0x000000FFu;   // black
    uint64_t seed = 0;
    int threads = 1;
    bool verbose = false;
    std::string input, output;
};

// Command-line number parsing. The whole string must be consumed; anything
// else raises InvalidParameterError naming `flag`.
double parse_double(const std::string &flag, const std::string &s);
int parse_int(const std::string &flag, const std::string &s);
// unsigned: a sign is rejected rather than wrapped
uint64_t parse_u64(const std::string &flag, const std::string &s);

AnimatorParams animator_params(const Options &opt);

// Resolve opt.clear_color in the raster palette; NoClearColorError if absent.
ColorIndex resolve_clear_color(const Raster &raster, const Options &opt);

// Raster -> traced shapes -> animated frames -> rendered images.
// Progress lines go to `log` when opt.verbose.
std::vector<IndexedImage> render_frames(const Raster &raster, const Options &opt, std::ostream &log);

// load opt.input, render, write the animated gif to opt.output
void render_file(const Options &opt, std::ostream &log);

} // namespace katzify

#endif
