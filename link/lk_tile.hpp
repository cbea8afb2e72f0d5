#pragma once
#include "shared_types.hpp"
#include "pl_math.hpp"
#include "pl_parse.hpp"

enum class tile_type : u8 {
    EMPTY = 0,

    // Resource kinds, eliminating them drops a resource
    GOLD,
    WOOD,
    STONE,
    MITHRIL,
    FOOD,

    // Filler kinds, matchable but drop nothing
    DIRT,
    GRASS,
    LAVA,
    SAND,

    COUNT
};
#define TILE_TYPE_MAX_KINDS ((i32)tile_type::COUNT - 1)

enum class tile_state : u8 {
    IDLE,
    SELECTED,
    ELIMINATED,
};

// One grid slot. row/col never change; type and state are rewritten in place by the grid.
struct tile {
    i16 row;
    i16 col;
    tile_type type;
    tile_state state;
};

enum class lk_err : u8 {
    NONE = 0,
    OUT_OF_BOUNDS,
    INVALID_DISTRIBUTION,
    INVALID_CONFIGURATION,
};

inline const char *lk_err_name(lk_err err) {
    switch (err) {
        case lk_err::NONE:                  return "none";
        case lk_err::OUT_OF_BOUNDS:         return "out of bounds";
        case lk_err::INVALID_DISTRIBUTION:  return "invalid distribution";
        case lk_err::INVALID_CONFIGURATION: return "invalid configuration";
    }
    return "unknown";
}

constexpr const char *tile_type_names[(u32)tile_type::COUNT] = {
    "empty",
    "gold", "wood", "stone", "mithril", "food",
    "dirt", "grass", "lava", "sand",
};

// Single character used by grid dumps, '.' is empty
constexpr char tile_type_glyphs[(u32)tile_type::COUNT] = {
    '.',
    'G', 'W', 'S', 'M', 'F',
    'd', 'g', 'l', 's',
};

inline const char *tile_type_name(tile_type t) {
    return (u32)t < (u32)tile_type::COUNT ? tile_type_names[(u32)t] : "?";
}

// tile_type::COUNT when the name is unknown
inline tile_type tile_type_from_name(strview name) {
    for (u32 i = 1; i < (u32)tile_type::COUNT; i++) {
        if (sv_eq(name, tile_type_names[i])) return (tile_type)i;
    }
    return tile_type::COUNT;
}

inline bool tile_type_is_resource(tile_type t) {
    return t >= tile_type::GOLD && t <= tile_type::FOOD;
}

inline bool tile_is_empty(const tile *t) {
    return t->type == tile_type::EMPTY;
}

inline ivec2 tile_pos(const tile *t) {
    return { t->col, t->row };
}
