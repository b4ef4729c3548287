#ifndef KATZIFY_ANIMATOR_HPP
#define KATZIFY_ANIMATOR_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "tracer.hpp"

namespace katzify {

using Frame = std::vector<Shape>;
using Animation = std::vector<Frame>;

// jitter beyond this would push coordinates toward int overflow
const int kMaxShakiness = 1 << 16;

struct AnimatorParams {
    double sloppiness = 0.1;  // fraction of each shape's points dropped per frame, [0,1]
    int shakiness = 1;        // max per-axis jitter in pixels, [0,kMaxShakiness]
    double shaky_freq = 0.25; // probability a kept point is jittered, > 0
    int frame_count = 5;      // >= 0
    uint64_t seed = 0;
    int threads = 1;
};

// Throws InvalidParameterError describing the first bad field.
void validate(const AnimatorParams &params);

// One frame's version of `shape`: drop floor(sloppiness * n) distinct
// points, keep the order of the rest, jitter each survivor with
// probability min(1, shaky_freq). Coordinates are not clamped.
Shape perturb_shape(const Shape &shape, const AnimatorParams &params, std::mt19937 &engine);

// Engine for frame `frame` of an animation seeded with `seed`.
std::mt19937 frame_engine(uint64_t seed, int frame);

// frame_count independent frames, each a perturbed copy of `shapes`.
// Same seed, same shapes: same Animation, whatever params.threads is.
Animation animate(const ShapeList &shapes, const AnimatorParams &params);

} // namespace katzify

#endif
