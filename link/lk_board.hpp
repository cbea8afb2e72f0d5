#pragma once
#include "shared.hpp"
#include "lk_tile.hpp"
#include "lk_grid.hpp"
#include "lk_path.hpp"
#include "lk_distrib.hpp"

struct board_config {
    i32 width;
    i32 height;
    tile_type types[TILE_TYPE_MAX_KINDS];
    i32 num_types;
    i32 counts[TILE_TYPE_MAX_KINDS];  // only read when explicit_counts is set
    bool explicit_counts;
    i32 empty_slots;
    bool smart_distribution;
    path_rules rules;
    bool verbose;
};

// 9x7, the five resource kinds, one empty slot, two bends, border wrap
void board_config_default(board_config *cfg);

// Overrides defaults with whatever keys the config carries
lk_err board_config_from_config(board_config *cfg, const engine_api *api, config *c);

enum class select_state : u8 {
    EMPTY,
    ONE_SELECTED,
};

enum class tap_result : u8 {
    IGNORED,      // empty slot or out of bounds
    SELECTED,
    DESELECTED,
    ELIMINATED,
    REJECTED,     // second tile did not match or could not be reached
};

struct board {
    grid g;
    board_config cfg;
    distrib_params dist;
    const engine_api *api;

    tile *selected[2];
    i32 num_selected;

    u32 eliminations;
    u32 refill_count;
};

// Fails with the grid or distribution error; b is unusable in that case
lk_err board_init(board *b, const engine_api *api, const board_config *cfg);

// Replaces the layout (tests, hosts restoring a layout) and drops the selection
lk_err board_load(board *b, const tile_type *types, i32 count);

lk_err board_tap(board *b, i32 row, i32 col, tap_result *out = nullptr);

// Feeds every queued input tap to board_tap, returns how many were handled
u32 board_tick(board *b);

inline select_state board_select_state(const board *b) {
    return b->num_selected == 0 ? select_state::EMPTY : select_state::ONE_SELECTED;
}
