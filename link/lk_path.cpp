#include "lk_path.hpp"

static bool path_pair_valid(const tile *a, const tile *b) {
    if (a == nullptr || b == nullptr || a == b) return false;
    if (tile_is_empty(a) || tile_is_empty(b)) return false;
    if (a->state == tile_state::ELIMINATED || b->state == tile_state::ELIMINATED) return false;
    return a->type == b->type;
}

static bool path_passable(const grid *g, const path_rules &rules, ivec2 p) {
    if (!grid_in_bounds(g, p.y, p.x)) {
        bool on_ring = p.x >= -1 && p.y >= -1 && p.x <= g->width && p.y <= g->height;
        return rules.border_wrap && on_ring;
    }
    return tile_is_empty(grid_get(g, p.y, p.x));
}

// Every slot strictly between from and to must be passable. from and to share a row or column.
static bool path_segment_clear(const grid *g, const path_rules &rules, ivec2 from, ivec2 to) {
    ivec2 step = ivec2_step_toward(from, to);
    if (step == ivec2_zero) return from == to;

    for (ivec2 p = from + step; p != to; p = p + step) {
        if (!path_passable(g, rules, p)) return false;
    }
    return true;
}

static void path_set(path *out, ivec2 a, const ivec2 *corners, i32 num_corners, ivec2 b) {
    out->num_points = 0;
    out->points[out->num_points++] = a;
    for (i32 i = 0; i < num_corners; i++) {
        out->points[out->num_points++] = corners[i];
    }
    out->points[out->num_points++] = b;
}

static bool path_try_straight(const grid *g, const path_rules &rules, ivec2 a, ivec2 b, path *out) {
    if (a.x != b.x && a.y != b.y) return false;
    if (!path_segment_clear(g, rules, a, b)) return false;

    path_set(out, a, nullptr, 0, b);
    return true;
}

static bool path_try_one_bend(const grid *g, const path_rules &rules, ivec2 a, ivec2 b, path *out) {
    if (a.x == b.x || a.y == b.y) return false;

    ivec2 corners[2] = { { b.x, a.y }, { a.x, b.y } };
    for (ivec2 c : corners) {
        if (!path_passable(g, rules, c)) continue;
        if (!path_segment_clear(g, rules, a, c) || !path_segment_clear(g, rules, c, b)) continue;

        path_set(out, a, &c, 1, b);
        return true;
    }
    return false;
}

static bool path_try_two_bends(const grid *g, const path_rules &rules, ivec2 a, ivec2 b, path *out) {
    i32 lo = rules.border_wrap ? -1 : 0;

    // Middle segment horizontal, on row y
    i32 row_hi = rules.border_wrap ? g->height : g->height - 1;
    for (i32 y = lo; y <= row_hi; y++) {
        if (y == a.y || y == b.y) continue;
        ivec2 c[2] = { { a.x, y }, { b.x, y } };
        if (c[0] == c[1]) continue;

        if (!path_passable(g, rules, c[0]) || !path_passable(g, rules, c[1])) continue;
        if (!path_segment_clear(g, rules, a, c[0])) continue;
        if (!path_segment_clear(g, rules, c[0], c[1])) continue;
        if (!path_segment_clear(g, rules, c[1], b)) continue;

        path_set(out, a, c, 2, b);
        return true;
    }

    // Middle segment vertical, on column x
    i32 col_hi = rules.border_wrap ? g->width : g->width - 1;
    for (i32 x = lo; x <= col_hi; x++) {
        if (x == a.x || x == b.x) continue;
        ivec2 c[2] = { { x, a.y }, { x, b.y } };
        if (c[0] == c[1]) continue;

        if (!path_passable(g, rules, c[0]) || !path_passable(g, rules, c[1])) continue;
        if (!path_segment_clear(g, rules, a, c[0])) continue;
        if (!path_segment_clear(g, rules, c[0], c[1])) continue;
        if (!path_segment_clear(g, rules, c[1], b)) continue;

        path_set(out, a, c, 2, b);
        return true;
    }
    return false;
}

bool path_find(const grid *g, path_rules rules, const tile *a, const tile *b, path *out) {
    if (!path_pair_valid(a, b)) return false;

    ivec2 pa = tile_pos(a);
    ivec2 pb = tile_pos(b);

    path tmp;
    path *dst = out ? out : &tmp;

    if (path_try_straight(g, rules, pa, pb, dst)) return true;
    if (rules.max_bends >= 1 && path_try_one_bend(g, rules, pa, pb, dst)) return true;
    if (rules.max_bends >= 2 && path_try_two_bends(g, rules, pa, pb, dst)) return true;
    return false;
}

bool path_can_connect(const grid *g, path_rules rules, const tile *a, const tile *b) {
    return path_find(g, rules, a, b, nullptr);
}

bool path_find_any_pair(grid *g, path_rules rules, tile **out_a, tile **out_b) {
    i32 n = grid_num_slots(g);
    for (i32 i = 0; i < n; i++) {
        tile *a = &g->tiles[i];
        if (tile_is_empty(a) || a->state == tile_state::ELIMINATED) continue;

        for (i32 j = i + 1; j < n; j++) {
            tile *b = &g->tiles[j];
            if (b->type != a->type) continue;

            if (path_can_connect(g, rules, a, b)) {
                *out_a = a;
                *out_b = b;
                return true;
            }
        }
    }
    return false;
}
