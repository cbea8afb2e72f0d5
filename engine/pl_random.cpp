#include "pl_random.hpp"
#include <cassert>
#include <random>

thread_local std::mt19937_64 g_rand_eng;
thread_local std::uniform_real_distribution<f32> g_rand_dist;

void rand_seed(i64 seed) {
    g_rand_eng.seed((u64)seed);
    g_rand_dist.reset();
}

static f32 rand_float01() {
    return g_rand_dist(g_rand_eng);
}

i32 rand_int(i32 max_val) {
    assert(max_val > 0);

    i32 v = (i32)(rand_float01() * max_val);
    return v < max_val ? v : max_val - 1;
}
