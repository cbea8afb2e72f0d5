#pragma once
#include "shared_types.hpp"
#include "pl_math.hpp"
#include "lk_grid.hpp"

#define PATH_MAX_BENDS 2
#define PATH_MAX_POINTS (PATH_MAX_BENDS + 2)

struct path_rules {
    i32 max_bends = PATH_MAX_BENDS;  // 0..PATH_MAX_BENDS
    bool border_wrap = true;         // one always-empty ring around the grid is walkable
};

// Endpoints plus corners, in grid coordinates (x = col, y = row).
// Corners may sit on the border ring at -1 or width/height.
struct path {
    ivec2 points[PATH_MAX_POINTS];
    i32 num_points;
};

// Finds a path of at most rules.max_bends bends through empty slots.
// Fails for the same tile twice, differing types, and empty or eliminated tiles.
bool path_find(const grid *g, path_rules rules, const tile *a, const tile *b, path *out);

bool path_can_connect(const grid *g, path_rules rules, const tile *a, const tile *b);

inline i32 path_bends(const path *p) {
    return p->num_points > 2 ? p->num_points - 2 : 0;
}

// First connectable pair in row-major order. Used for hints and automated play.
bool path_find_any_pair(grid *g, path_rules rules, tile **out_a, tile **out_b);
