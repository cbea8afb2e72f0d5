#include "test_support.hpp"
#include "lk_path.hpp"

#include <cstring>
#include <deque>
#include <random>

// Rows of tile glyphs, '.' is empty
static void grid_from_rows(grid *g, std::initializer_list<const char*> rows) {
    i32 height = (i32)rows.size();
    i32 width = (i32)strlen(*rows.begin());
    ASSERT_EQ(grid_init(g, width, height), lk_err::NONE);

    i32 row = 0;
    for (const char *r : rows) {
        ASSERT_EQ((i32)strlen(r), width);
        for (i32 col = 0; col < width; col++) {
            tile_type type = tile_type::COUNT;
            for (u32 k = 0; k < (u32)tile_type::COUNT; k++) {
                if (tile_type_glyphs[k] == r[col]) type = (tile_type)k;
            }
            ASSERT_NE(type, tile_type::COUNT) << "unknown glyph " << r[col];
            grid_get(g, row, col)->type = type;
        }
        row++;
    }
}

static path_rules rules_of(i32 max_bends, bool border_wrap) {
    path_rules r;
    r.max_bends = max_bends;
    r.border_wrap = border_wrap;
    return r;
}

// Minimum number of turns between a and b, or -1. 0-1 BFS over (slot, heading).
static i32 min_turns(const grid *g, path_rules rules, const tile *a, const tile *b) {
    i32 lo = rules.border_wrap ? -1 : 0;
    i32 w = g->width + (rules.border_wrap ? 2 : 0);
    i32 h = g->height + (rules.border_wrap ? 2 : 0);
    auto slot_of = [&](ivec2 p, i32 d) { return (((p.y - lo) * w) + (p.x - lo)) * 4 + d; };
    auto inside = [&](ivec2 p) { return p.x >= lo && p.y >= lo && p.x - lo < w && p.y - lo < h; };
    auto passable = [&](ivec2 p) {
        const tile *t = grid_get(g, p.y, p.x);
        return t == nullptr || tile_is_empty(t);
    };

    std::vector<i32> dist(w * h * 4, -1);
    std::deque<std::pair<ivec2, i32>> queue;
    ivec2 start = tile_pos(a);
    ivec2 goal = tile_pos(b);
    i32 best = -1;

    for (i32 d = 0; d < 4; d++) {
        ivec2 n = start + direction_vectors[d];
        if (n == goal) return 0;
        if (!inside(n) || !passable(n)) continue;
        dist[slot_of(n, d)] = 0;
        queue.push_back({ n, d });
    }

    while (!queue.empty()) {
        std::pair<ivec2, i32> cur = queue.front();
        queue.pop_front();
        i32 turns = dist[slot_of(cur.first, cur.second)];

        for (i32 d = 0; d < 4; d++) {
            if (d == (cur.second + 2) % 4) continue;
            i32 cost = turns + (d == cur.second ? 0 : 1);
            ivec2 n = cur.first + direction_vectors[d];
            if (n == goal) {
                if (best < 0 || cost < best) best = cost;
                continue;
            }
            if (!inside(n) || !passable(n)) continue;

            i32 &slot = dist[slot_of(n, d)];
            if (slot >= 0 && slot <= cost) continue;
            slot = cost;
            if (cost == turns) queue.push_front({ n, d });
            else queue.push_back({ n, d });
        }
    }
    return best;
}

TEST(path, straight_line_through_empty_row) {
    grid g;
    grid_from_rows(&g, { "G.G", "...", "..." });
    tile *a = grid_get(&g, 0, 0);
    tile *b = grid_get(&g, 0, 2);

    path p;
    ASSERT_TRUE(path_find(&g, path_rules{}, a, b, &p));
    EXPECT_EQ(p.num_points, 2);
    EXPECT_EQ(path_bends(&p), 0);
    expect_sound_path(&g, p, a, b, true);
}

TEST(path, adjacent_tiles_connect) {
    grid g;
    grid_from_rows(&g, { "SGGS" });
    path p;
    ASSERT_TRUE(path_find(&g, rules_of(0, false), grid_get(&g, 0, 1), grid_get(&g, 0, 2), &p));
    EXPECT_EQ(p.num_points, 2);
}

TEST(path, blocked_row_goes_over_the_top_border) {
    grid g;
    grid_from_rows(&g, { "GSG", "...", "..." });
    tile *a = grid_get(&g, 0, 0);
    tile *b = grid_get(&g, 0, 2);

    path p;
    ASSERT_TRUE(path_find(&g, rules_of(2, true), a, b, &p));
    ASSERT_EQ(path_bends(&p), 2);
    EXPECT_EQ(p.points[1], (ivec2{ 0, -1 }));
    EXPECT_EQ(p.points[2], (ivec2{ 2, -1 }));
    expect_sound_path(&g, p, a, b, true);

    // Without the border the detour runs through row 1
    ASSERT_TRUE(path_find(&g, rules_of(2, false), a, b, &p));
    EXPECT_EQ(p.points[1], (ivec2{ 0, 1 }));
    EXPECT_EQ(p.points[2], (ivec2{ 2, 1 }));
    expect_sound_path(&g, p, a, b, false);
}

TEST(path, border_is_the_only_way_out) {
    grid g;
    grid_from_rows(&g, { "GSG", "SSS", "..." });
    tile *a = grid_get(&g, 0, 0);
    tile *b = grid_get(&g, 0, 2);

    EXPECT_TRUE(path_can_connect(&g, rules_of(2, true), a, b));
    EXPECT_FALSE(path_can_connect(&g, rules_of(2, false), a, b));
    EXPECT_FALSE(path_can_connect(&g, rules_of(1, true), a, b));
}

TEST(path, one_bend_corner) {
    grid g;
    grid_from_rows(&g, { "G..", "...", "..G" });
    tile *a = grid_get(&g, 0, 0);
    tile *b = grid_get(&g, 2, 2);

    path p;
    ASSERT_TRUE(path_find(&g, rules_of(2, false), a, b, &p));
    ASSERT_EQ(path_bends(&p), 1);
    EXPECT_EQ(p.points[1], (ivec2{ 2, 0 }));
    expect_sound_path(&g, p, a, b, false);

    EXPECT_FALSE(path_can_connect(&g, rules_of(0, true), a, b));
}

TEST(path, two_bends_inside_the_grid) {
    grid g;
    grid_from_rows(&g, {
        "SSSSS",
        "SG.SS",
        "SSS.S",
        "SS.GS",
        "SSSSS",
    });
    tile *a = grid_get(&g, 1, 1);
    tile *b = grid_get(&g, 3, 3);

    EXPECT_FALSE(path_can_connect(&g, rules_of(2, true), a, b));

    grid_get(&g, 1, 3)->type = tile_type::EMPTY;
    path p;
    ASSERT_TRUE(path_find(&g, rules_of(2, false), a, b, &p));
    EXPECT_EQ(path_bends(&p), 1);

    grid_get(&g, 1, 3)->type = tile_type::STONE;
    grid_get(&g, 2, 2)->type = tile_type::EMPTY;
    ASSERT_TRUE(path_find(&g, rules_of(2, false), a, b, &p));
    EXPECT_EQ(path_bends(&p), 2);
    expect_sound_path(&g, p, a, b, false);
    EXPECT_FALSE(path_can_connect(&g, rules_of(1, false), a, b));
}

TEST(path, three_bends_are_never_enough) {
    // Zig-zag needs three turns
    grid g;
    grid_from_rows(&g, {
        "SSSSS",
        "SG.SS",
        "SS.SS",
        "SS..S",
        "SSSGS",
    });
    tile *a = grid_get(&g, 1, 1);
    tile *b = grid_get(&g, 4, 3);
    EXPECT_FALSE(path_can_connect(&g, rules_of(2, true), a, b));
    EXPECT_EQ(min_turns(&g, rules_of(2, true), a, b), 3);
}

TEST(path, enclosed_tile_cannot_connect) {
    grid g;
    grid_from_rows(&g, {
        "G....",
        "..S..",
        ".SGS.",
        "..S..",
        ".....",
    });
    tile *a = grid_get(&g, 0, 0);
    tile *b = grid_get(&g, 2, 2);
    for (i32 bends = 0; bends <= PATH_MAX_BENDS; bends++) {
        EXPECT_FALSE(path_can_connect(&g, rules_of(bends, true), a, b));
        EXPECT_FALSE(path_can_connect(&g, rules_of(bends, false), a, b));
    }
}

TEST(path, rejects_invalid_pairs) {
    grid g;
    grid_from_rows(&g, { "GGW.", "...." });
    tile *g1 = grid_get(&g, 0, 0);
    tile *g2 = grid_get(&g, 0, 1);
    tile *w = grid_get(&g, 0, 2);
    tile *e = grid_get(&g, 0, 3);

    EXPECT_FALSE(path_can_connect(&g, path_rules{}, g1, g1));
    EXPECT_FALSE(path_can_connect(&g, path_rules{}, g2, w));
    EXPECT_FALSE(path_can_connect(&g, path_rules{}, e, grid_get(&g, 1, 3)));
    EXPECT_FALSE(path_can_connect(&g, path_rules{}, g1, nullptr));

    g2->state = tile_state::ELIMINATED;
    EXPECT_FALSE(path_can_connect(&g, path_rules{}, g1, g2));
    g2->state = tile_state::IDLE;
    EXPECT_TRUE(path_can_connect(&g, path_rules{}, g1, g2));
}

TEST(path, find_any_pair) {
    grid g;
    grid_from_rows(&g, { "GW", "WG" });
    tile *a = nullptr;
    tile *b = nullptr;
    EXPECT_FALSE(path_find_any_pair(&g, path_rules{}, &a, &b));

    grid_from_rows(&g, { "GW", ".G" });
    ASSERT_TRUE(path_find_any_pair(&g, path_rules{}, &a, &b));
    EXPECT_EQ(a, grid_get(&g, 0, 0));
    EXPECT_EQ(b, grid_get(&g, 1, 1));

    grid_from_rows(&g, { "..", ".." });
    EXPECT_FALSE(path_find_any_pair(&g, path_rules{}, &a, &b));
}

TEST(path, agrees_with_turn_counting_search) {
    std::mt19937 rng(2024);
    const tile_type kinds[3] = { tile_type::GOLD, tile_type::WOOD, tile_type::STONE };

    for (i32 round = 0; round < 200; round++) {
        grid g;
        i32 width = 2 + (i32)(rng() % 6);
        i32 height = 2 + (i32)(rng() % 5);
        ASSERT_EQ(grid_init(&g, width, height), lk_err::NONE);
        for (i32 i = 0; i < width * height; i++) {
            g.tiles[i].type = rng() % 10 < 4 ? tile_type::EMPTY : kinds[rng() % 3];
        }

        for (i32 i = 0; i < width * height; i++) {
            for (i32 j = i + 1; j < width * height; j++) {
                tile *a = &g.tiles[i];
                tile *b = &g.tiles[j];
                if (tile_is_empty(a) || a->type != b->type) continue;

                for (i32 bends = 0; bends <= PATH_MAX_BENDS; bends++) {
                    for (i32 wrap = 0; wrap <= 1; wrap++) {
                        path_rules rules = rules_of(bends, wrap != 0);
                        i32 turns = min_turns(&g, rules, a, b);
                        bool expected = turns >= 0 && turns <= bends;

                        path p;
                        bool found = path_find(&g, rules, a, b, &p);
                        ASSERT_EQ(found, expected)
                            << "round " << round << " (" << a->row << "," << a->col << ")-("
                            << b->row << "," << b->col << ") bends=" << bends << " wrap=" << wrap;
                        if (found) {
                            EXPECT_LE(path_bends(&p), bends);
                            expect_sound_path(&g, p, a, b, wrap != 0);
                        }
                    }
                }
            }
        }
    }
}
