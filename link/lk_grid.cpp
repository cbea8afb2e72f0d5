#include "lk_grid.hpp"

lk_err grid_init(grid *g, i32 width, i32 height) {
    // Bound each side first so the product cannot overflow
    if (width < 1 || height < 1 || width > GRID_MAX_SLOTS || height > GRID_MAX_SLOTS ||
        width * height > GRID_MAX_SLOTS) {
        return lk_err::INVALID_CONFIGURATION;
    }

    g->width = width;
    g->height = height;
    for (i32 row = 0; row < height; row++) {
        for (i32 col = 0; col < width; col++) {
            tile &t = g->tiles[row * width + col];
            t.row = (i16)row;
            t.col = (i16)col;
            t.type = tile_type::EMPTY;
            t.state = tile_state::IDLE;
        }
    }
    return lk_err::NONE;
}

tile *grid_get(grid *g, i32 row, i32 col) {
    if (!grid_in_bounds(g, row, col)) return nullptr;
    return &g->tiles[row * g->width + col];
}

const tile *grid_get(const grid *g, i32 row, i32 col) {
    if (!grid_in_bounds(g, row, col)) return nullptr;
    return &g->tiles[row * g->width + col];
}

lk_err grid_fill(grid *g, const tile_type *types, i32 count) {
    if (count != grid_num_slots(g)) {
        return lk_err::INVALID_DISTRIBUTION;
    }
    for (i32 i = 0; i < count; i++) {
        if ((u32)types[i] >= (u32)tile_type::COUNT) return lk_err::INVALID_DISTRIBUTION;
    }

    for (i32 i = 0; i < count; i++) {
        g->tiles[i].type = types[i];
        g->tiles[i].state = tile_state::IDLE;
    }
    return lk_err::NONE;
}

lk_err grid_clear_slot(grid *g, i32 row, i32 col) {
    tile *t = grid_get(g, row, col);
    if (!t) return lk_err::OUT_OF_BOUNDS;

    t->type = tile_type::EMPTY;
    t->state = tile_state::IDLE;
    return lk_err::NONE;
}

bool grid_is_fully_empty(const grid *g) {
    return grid_occupied_count(g) == 0;
}

i32 grid_occupied_count(const grid *g) {
    i32 n = 0;
    for (i32 i = 0; i < grid_num_slots(g); i++) {
        if (!tile_is_empty(&g->tiles[i])) n++;
    }
    return n;
}

i32 grid_count_type(const grid *g, tile_type type) {
    i32 n = 0;
    for (i32 i = 0; i < grid_num_slots(g); i++) {
        if (g->tiles[i].type == type) n++;
    }
    return n;
}

void grid_dump(const grid *g, FILE *out) {
    for (i32 row = 0; row < g->height; row++) {
        for (i32 col = 0; col < g->width; col++) {
            const tile *t = grid_get(g, row, col);
            fputc(tile_type_glyphs[(u32)t->type], out);
            fputc(t->state == tile_state::SELECTED ? '*' : ' ', out);
        }
        fputc('\n', out);
    }
}
