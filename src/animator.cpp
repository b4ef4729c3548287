#include "animator.hpp"
#include "error.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>
#include <string>
#include <thread>

using namespace std;

namespace katzify {

void validate(const AnimatorParams &p)
{
    if(!(p.sloppiness >= 0.0 && p.sloppiness <= 1.0))
        throw InvalidParameterError("sloppiness must be in [0,1], got " + to_string(p.sloppiness));
    if(p.shakiness < 0 || p.shakiness > kMaxShakiness)
        throw InvalidParameterError("shakiness must be in [0," + to_string(kMaxShakiness) + "], got " + to_string(p.shakiness));
    if(!(p.shaky_freq > 0.0))
        throw InvalidParameterError("shaky frequency must be > 0, got " + to_string(p.shaky_freq));
    if(p.frame_count < 0)
        throw InvalidParameterError("frame count must be >= 0, got " + to_string(p.frame_count));
}

mt19937 frame_engine(uint64_t seed, int frame)
{
    seed_seq seq{ (uint32_t)(seed & 0xFFFFFFFFu), (uint32_t)(seed >> 32), (uint32_t)frame };
    return mt19937(seq);
}

// ---------------------- Per-shape perturbation ----------------------
Shape perturb_shape(const Shape &shape, const AnimatorParams &params, mt19937 &engine)
{
    size_t n = shape.size();
    size_t drop = (size_t)floor(params.sloppiness * (double)n);
    drop = min(drop, n);

    // partial Fisher-Yates: the first `drop` slots of idx are the victims
    vector<char> removed(n, 0);
    if(drop > 0){
        vector<size_t> idx(n);
        iota(idx.begin(), idx.end(), 0);
        for(size_t i=0;i<drop;++i){
            uniform_int_distribution<size_t> pick(i, n - 1);
            swap(idx[i], idx[pick(engine)]);
            removed[idx[i]] = 1;
        }
    }

    Shape out;
    out.reserve(n - drop);
    bernoulli_distribution shake(min(1.0, params.shaky_freq));
    uniform_int_distribution<int> offset(-params.shakiness, params.shakiness);
    for(size_t i=0;i<n;++i){
        if(removed[i]) continue;
        Point p = shape[i];
        if(shake(engine)){
            p.x += offset(engine);
            p.y += offset(engine);
        }
        out.push_back(p);
    }
    return out;
}

// ---------------------- Frames ----------------------
Animation animate(const ShapeList &shapes, const AnimatorParams &params)
{
    validate(params);
    Animation animation(params.frame_count);
    if(params.frame_count == 0) return animation;

    atomic<int> next_frame(0);
    auto worker = [&](){
        while(true){
            int f = next_frame.fetch_add(1);
            if(f >= params.frame_count) break;
            mt19937 engine = frame_engine(params.seed, f);
            Frame frame;
            frame.reserve(shapes.size());
            for(auto &shape : shapes) frame.push_back(perturb_shape(shape, params, engine));
            animation[f] = move(frame);
        }
    };

    int threads = max(1, min(params.threads, params.frame_count));
    if(threads == 1){
        worker();
        return animation;
    }
    vector<thread> pool;
    for(int i=0;i<threads;++i) pool.emplace_back(worker);
    for(auto &t : pool) t.join();
    return animation;
}

} // namespace katzify
