#pragma once
#include "shared_types.hpp"
#include "lk_tile.hpp"

#include <cstdio>

#define GRID_MAX_SLOTS 256
#define GRID_DEFAULT_WIDTH 9
#define GRID_DEFAULT_HEIGHT 7

// Row-major, tiles[row * width + col]
struct grid {
    tile tiles[GRID_MAX_SLOTS];
    i32 width;
    i32 height;
};

lk_err grid_init(grid *g, i32 width, i32 height);

inline i32 grid_num_slots(const grid *g) {
    return g->width * g->height;
}

inline bool grid_in_bounds(const grid *g, i32 row, i32 col) {
    return row >= 0 && col >= 0 && row < g->height && col < g->width;
}

// nullptr when out of bounds
tile *grid_get(grid *g, i32 row, i32 col);
const tile *grid_get(const grid *g, i32 row, i32 col);

// types[i] goes to slot i in row-major order; every state is reset to IDLE
lk_err grid_fill(grid *g, const tile_type *types, i32 count);

lk_err grid_clear_slot(grid *g, i32 row, i32 col);

bool grid_is_fully_empty(const grid *g);
i32 grid_occupied_count(const grid *g);
i32 grid_count_type(const grid *g, tile_type type);

// One line per row, tile glyphs with '*' after a selected tile
void grid_dump(const grid *g, FILE *out);
