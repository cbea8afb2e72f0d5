#pragma once
#include "shared_types.hpp"
#include "pl_random.hpp"
#include "lk_tile.hpp"
#include "lk_grid.hpp"

#define DISTRIB_DEFAULT_EMPTY_SLOTS 1
#define DISTRIB_SMART_RETRIES 3

struct distrib_params {
    tile_type types[TILE_TYPE_MAX_KINDS];
    i32 counts[TILE_TYPE_MAX_KINDS];  // even, one per type
    i32 num_types;
    i32 empty_slots;
    i32 width;                        // only the smart placement needs the layout
    i32 height;
    bool smart;
};

// Splits (num_slots - empty) into num_types even counts differing by at most 2.
// The reserved empty count grows by one when needed to leave an even remainder.
lk_err distrib_partition(i32 num_slots, i32 num_types, i32 empty_slots, i32 *out_counts, i32 *out_empty);

// Checks explicit counts: all even, non-negative, and summing with empty_slots to num_slots
lk_err distrib_validate(i32 num_slots, i32 num_types, const i32 *counts, i32 empty_slots);

// Writes width*height entries into out, shuffled with rand_fn
lk_err distrib_generate(const distrib_params *p, rand_int_fn rand_fn, tile_type *out, i32 out_len);
