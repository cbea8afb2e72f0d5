#include "lk_distrib.hpp"

lk_err distrib_partition(i32 num_slots, i32 num_types, i32 empty_slots, i32 *out_counts, i32 *out_empty) {
    if (num_slots <= 0 || num_types <= 0 || num_types > TILE_TYPE_MAX_KINDS || empty_slots < 0) {
        return lk_err::INVALID_CONFIGURATION;
    }

    i32 empty = empty_slots;
    if ((num_slots - empty) % 2 != 0) empty++;
    if (empty > num_slots) {
        return lk_err::INVALID_CONFIGURATION;
    }

    // Hand out pairs so every count stays even; leftovers go to the last types
    i32 pairs = (num_slots - empty) / 2;
    i32 base = pairs / num_types;
    i32 extra = pairs % num_types;
    for (i32 i = 0; i < num_types; i++) {
        bool gets_extra = i >= num_types - extra;
        out_counts[i] = (base + (gets_extra ? 1 : 0)) * 2;
    }

    *out_empty = empty;
    return lk_err::NONE;
}

lk_err distrib_validate(i32 num_slots, i32 num_types, const i32 *counts, i32 empty_slots) {
    if (num_types <= 0 || num_types > TILE_TYPE_MAX_KINDS || empty_slots < 0) {
        return lk_err::INVALID_DISTRIBUTION;
    }

    i32 total = empty_slots;
    for (i32 i = 0; i < num_types; i++) {
        if (counts[i] < 0 || counts[i] % 2 != 0) return lk_err::INVALID_DISTRIBUTION;
        total += counts[i];
    }
    return total == num_slots ? lk_err::NONE : lk_err::INVALID_DISTRIBUTION;
}

// Fewer than two same-type orthogonal neighbours already placed
static bool distrib_good_position(const tile_type *layout, const distrib_params *p, ivec2 pos, tile_type type) {
    if (type == tile_type::EMPTY) return true;

    i32 same = 0;
    for (i32 d = 0; d < (i32)direction::COUNT; d++) {
        ivec2 n = pos + direction_vectors[d];
        if (n.x < 0 || n.y < 0 || n.x >= p->width || n.y >= p->height) continue;
        if (layout[n.y * p->width + n.x] == type) same++;
    }
    return same < 2;
}

static bool distrib_try_smart(const distrib_params *p, rand_int_fn rand_fn, tile_type *out) {
    i32 n = p->width * p->height;

    i32 order[GRID_MAX_SLOTS];
    bool placed_at[GRID_MAX_SLOTS];
    for (i32 i = 0; i < n; i++) {
        order[i] = i;
        placed_at[i] = false;
        out[i] = tile_type::EMPTY;
    }
    rand_shuffle(order, n, rand_fn);

    // Most numerous types first, they are the hardest to spread out
    i32 by_count[TILE_TYPE_MAX_KINDS];
    for (i32 i = 0; i < p->num_types; i++) by_count[i] = i;
    for (i32 i = 1; i < p->num_types; i++) {
        i32 key = by_count[i];
        i32 j = i - 1;
        while (j >= 0 && p->counts[by_count[j]] < p->counts[key]) {
            by_count[j + 1] = by_count[j];
            j--;
        }
        by_count[j + 1] = key;
    }

    i32 cursor = 0;
    for (i32 k = 0; k < p->num_types; k++) {
        tile_type type = p->types[by_count[k]];
        i32 want = p->counts[by_count[k]];
        i32 placed = 0;
        i32 attempts = 0;

        while (placed < want && attempts < n * 2) {
            i32 slot = order[cursor % n];
            ivec2 pos = { slot % p->width, slot / p->width };

            if (!placed_at[slot] && distrib_good_position(out, p, pos, type)) {
                out[slot] = type;
                placed_at[slot] = true;
                placed++;
            }
            cursor++;
            attempts++;
        }

        if (placed < want) return false;
    }

    // Whatever is left stays EMPTY
    return true;
}

lk_err distrib_generate(const distrib_params *p, rand_int_fn rand_fn, tile_type *out, i32 out_len) {
    i32 n = p->width * p->height;
    if (n != out_len || n > GRID_MAX_SLOTS) {
        return lk_err::INVALID_DISTRIBUTION;
    }

    lk_err err = distrib_validate(n, p->num_types, p->counts, p->empty_slots);
    if (err != lk_err::NONE) return err;

    if (p->smart) {
        for (i32 attempt = 0; attempt < DISTRIB_SMART_RETRIES; attempt++) {
            if (distrib_try_smart(p, rand_fn, out)) return lk_err::NONE;
        }
    }

    i32 idx = 0;
    for (i32 i = 0; i < p->num_types; i++) {
        for (i32 c = 0; c < p->counts[i]; c++) {
            out[idx++] = p->types[i];
        }
    }
    for (i32 e = 0; e < p->empty_slots; e++) {
        out[idx++] = tile_type::EMPTY;
    }

    rand_shuffle(out, n, rand_fn);
    return lk_err::NONE;
}
