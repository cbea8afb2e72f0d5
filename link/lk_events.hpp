#pragma once
#include "shared_types.hpp"
#include "pl_bus.hpp"
#include "lk_tile.hpp"
#include "lk_path.hpp"

enum class game_event : u16 {
    TILE_SELECTED = (u16)event_type::GAME_EVENTS_START,
    TILE_DESELECTED,
    MATCH_ATTEMPTED,
    MATCH_FAILED,
    TILES_ELIMINATED,
    BOARD_REFILLED,
};

// ===== GAME EVENT DATA STRUCTURES =====

struct tile_event {
    i32 row;
    i32 col;
    tile_type type;
};

// MATCH_ATTEMPTED and MATCH_FAILED
struct match_event {
    tile_event a;
    tile_event b;
};

// Drop physics spawns one falling resource per tile when drops_resource is set
struct tiles_eliminated_event {
    tile_event a;
    tile_event b;
    tile_type type;
    bool drops_resource;
    path link;  // for drawing the connection
};

struct board_refilled_event {
    u32 refill_count;
    i32 empty_slots;
};

#define bus_subscribe_game(api, evt, fn, user_data) \
    (api)->bus_subscribe((api)->bus, (event_type)(evt), fn, user_data)

inline tile_event tile_event_of(const tile *t) {
    return { t->row, t->col, t->type };
}
