#include "lk_board.hpp"
#include "lk_events.hpp"

#include "pl_bus.hpp"
#include "pl_config.hpp"
#include "pl_input.hpp"
#include "pl_parse.hpp"

#include <cstdio>

void board_config_default(board_config *cfg) {
    cfg->width = GRID_DEFAULT_WIDTH;
    cfg->height = GRID_DEFAULT_HEIGHT;

    cfg->num_types = 0;
    for (tile_type t = tile_type::GOLD; t <= tile_type::FOOD; t = (tile_type)((u8)t + 1)) {
        cfg->types[cfg->num_types++] = t;
    }
    cfg->explicit_counts = false;
    cfg->empty_slots = DISTRIB_DEFAULT_EMPTY_SLOTS;
    cfg->smart_distribution = false;
    cfg->rules = path_rules{};
    cfg->verbose = false;
}

static lk_err board_config_read_int(const engine_api *api, config *c, const char *key, i32 *out) {
    config_value val;
    if (!api->config_read(c, key, &val)) return lk_err::NONE;

    if (val.type != value_type::SINGLE) {
        printf("ERROR: config key '%s' must be a single integer\n", key);
        return lk_err::INVALID_CONFIGURATION;
    }
    *out = val.single;
    return lk_err::NONE;
}

static lk_err board_config_read_types(board_config *cfg, const engine_api *api, config *c) {
    config_value val;
    if (!api->config_read(c, "tile_types", &val)) return lk_err::NONE;

    if (val.type != value_type::STRING) {
        printf("ERROR: tile_types must be a quoted, comma separated list of names\n");
        return lk_err::INVALID_CONFIGURATION;
    }

    strview names[TILE_TYPE_MAX_KINDS];
    u64 num = api->sv_split({ val.str.arr, val.str.len }, ",", names, TILE_TYPE_MAX_KINDS);
    if (num == 0) {
        printf("ERROR: tile_types lists no types or more than %d\n", TILE_TYPE_MAX_KINDS);
        return lk_err::INVALID_CONFIGURATION;
    }

    cfg->num_types = 0;
    for (u64 i = 0; i < num; i++) {
        strview name = api->sv_trim(names[i]);
        tile_type t = tile_type_from_name(name);
        if (t == tile_type::COUNT) {
            printf("ERROR: unknown tile type '" SV_FMT "'\n", SV_ARG(name));
            return lk_err::INVALID_CONFIGURATION;
        }
        for (i32 k = 0; k < cfg->num_types; k++) {
            if (cfg->types[k] == t) {
                printf("ERROR: tile type '%s' listed twice\n", tile_type_name(t));
                return lk_err::INVALID_CONFIGURATION;
            }
        }
        cfg->types[cfg->num_types++] = t;
    }
    return lk_err::NONE;
}

static lk_err board_config_read_counts(board_config *cfg, const engine_api *api, config *c) {
    config_value val;
    if (!api->config_read(c, "distribution", &val)) return lk_err::NONE;

    const i32 *counts = nullptr;
    u64 len = 0;
    if (val.type == value_type::ARRAY) {
        counts = val.array.arr;
        len = val.array.len;
    } else if (val.type == value_type::SINGLE) {
        counts = &val.single;
        len = 1;
    }

    if (counts == nullptr || len != (u64)cfg->num_types) {
        printf("ERROR: distribution needs one count per tile type (%d)\n", cfg->num_types);
        return lk_err::INVALID_DISTRIBUTION;
    }

    for (u64 i = 0; i < len; i++) {
        cfg->counts[i] = counts[i];
    }
    cfg->explicit_counts = true;
    return lk_err::NONE;
}

lk_err board_config_from_config(board_config *cfg, const engine_api *api, config *c) {
    lk_err err = lk_err::NONE;
    i32 smart = cfg->smart_distribution ? 1 : 0;
    i32 wrap = cfg->rules.border_wrap ? 1 : 0;
    i32 verbose = cfg->verbose ? 1 : 0;

    if ((err = board_config_read_int(api, c, "grid_width", &cfg->width)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "grid_height", &cfg->height)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "empty_slots", &cfg->empty_slots)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "smart_distribution", &smart)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "max_bends", &cfg->rules.max_bends)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "border_wrap", &wrap)) != lk_err::NONE) return err;
    if ((err = board_config_read_int(api, c, "verbose", &verbose)) != lk_err::NONE) return err;
    if ((err = board_config_read_types(cfg, api, c)) != lk_err::NONE) return err;
    if ((err = board_config_read_counts(cfg, api, c)) != lk_err::NONE) return err;

    cfg->smart_distribution = smart != 0;
    cfg->rules.border_wrap = wrap != 0;
    cfg->verbose = verbose != 0;

    if (cfg->rules.max_bends < 0 || cfg->rules.max_bends > PATH_MAX_BENDS) {
        printf("ERROR: max_bends must be between 0 and %d\n", PATH_MAX_BENDS);
        return lk_err::INVALID_CONFIGURATION;
    }
    return lk_err::NONE;
}

// BOARD -------------------------------------------

template<class T>
static void board_fire(board *b, game_event type, const T &data) {
    if (!bus_fire_event(b->api, type, data)) {
        printf("[LINK] event queue full, dropped event %u\n", (u32)type);
    }
}

static void board_log_counts(board *b, const char *what) {
    if (!b->cfg.verbose) return;

    printf("[LINK] %s %dx%d:", what, b->g.width, b->g.height);
    for (i32 i = 0; i < b->dist.num_types; i++) {
        tile_type t = b->dist.types[i];
        printf(" %s=%d", tile_type_name(t), grid_count_type(&b->g, t));
    }
    printf(" empty=%d\n", grid_count_type(&b->g, tile_type::EMPTY));
}

static lk_err board_generate(board *b) {
    tile_type layout[GRID_MAX_SLOTS];
    i32 n = grid_num_slots(&b->g);

    lk_err err = distrib_generate(&b->dist, b->api->rand_int, layout, n);
    if (err != lk_err::NONE) return err;

    return grid_fill(&b->g, layout, n);
}

lk_err board_init(board *b, const engine_api *api, const board_config *cfg) {
    b->api = api;
    b->cfg = *cfg;
    b->num_selected = 0;
    b->eliminations = 0;
    b->refill_count = 0;

    lk_err err = grid_init(&b->g, cfg->width, cfg->height);
    if (err != lk_err::NONE) {
        printf("ERROR: grid %dx%d is not usable (at most %d slots)\n", cfg->width, cfg->height, GRID_MAX_SLOTS);
        return err;
    }

    distrib_params &d = b->dist;
    d.num_types = cfg->num_types;
    d.width = cfg->width;
    d.height = cfg->height;
    d.smart = cfg->smart_distribution;
    for (i32 i = 0; i < cfg->num_types && i < TILE_TYPE_MAX_KINDS; i++) {
        d.types[i] = cfg->types[i];
    }

    i32 n = grid_num_slots(&b->g);
    if (cfg->explicit_counts) {
        err = distrib_validate(n, cfg->num_types, cfg->counts, cfg->empty_slots);
        if (err == lk_err::NONE) {
            for (i32 i = 0; i < cfg->num_types; i++) d.counts[i] = cfg->counts[i];
            d.empty_slots = cfg->empty_slots;
        }
    } else {
        err = distrib_partition(n, cfg->num_types, cfg->empty_slots, d.counts, &d.empty_slots);
    }
    if (err != lk_err::NONE) {
        printf("ERROR: cannot split %d slots into even counts for %d type(s) with %d empty: %s\n",
               n, cfg->num_types, cfg->empty_slots, lk_err_name(err));
        return err;
    }

    err = board_generate(b);
    if (err == lk_err::NONE) {
        board_log_counts(b, "filled");
    }
    return err;
}

lk_err board_load(board *b, const tile_type *types, i32 count) {
    lk_err err = grid_fill(&b->g, types, count);
    if (err == lk_err::NONE) {
        b->num_selected = 0;
    }
    return err;
}

static void board_deselect(board *b, tile *t) {
    t->state = tile_state::IDLE;

    for (i32 i = 0; i < b->num_selected; i++) {
        if (b->selected[i] == t) {
            b->selected[i] = b->selected[b->num_selected - 1];
            b->num_selected--;
            break;
        }
    }

    tile_event evt = tile_event_of(t);
    board_fire(b, game_event::TILE_DESELECTED, evt);
}

static void board_clear_selection(board *b) {
    while (b->num_selected > 0) {
        board_deselect(b, b->selected[0]);
    }
}

// Refill only once the last pair is gone
static void board_check_refill(board *b) {
    if (!grid_is_fully_empty(&b->g)) return;

    lk_err err = board_generate(b);
    if (err != lk_err::NONE) {
        printf("ERROR: refill failed: %s\n", lk_err_name(err));
        return;
    }
    b->refill_count++;
    board_log_counts(b, "refilled");

    board_refilled_event evt { b->refill_count, b->dist.empty_slots };
    board_fire(b, game_event::BOARD_REFILLED, evt);
}

static void board_eliminate(board *b, tile *t1, tile *t2, const path *link) {
    t1->state = tile_state::ELIMINATED;
    t2->state = tile_state::ELIMINATED;

    tiles_eliminated_event evt;
    evt.a = tile_event_of(t1);
    evt.b = tile_event_of(t2);
    evt.type = t1->type;
    evt.drops_resource = tile_type_is_resource(t1->type);
    evt.link = *link;

    grid_clear_slot(&b->g, t1->row, t1->col);
    grid_clear_slot(&b->g, t2->row, t2->col);
    b->num_selected = 0;
    b->eliminations++;

    board_fire(b, game_event::TILES_ELIMINATED, evt);
    board_check_refill(b);
}

static tap_result board_resolve_pair(board *b) {
    tile *t1 = b->selected[0];
    tile *t2 = b->selected[1];

    match_event attempt { tile_event_of(t1), tile_event_of(t2) };
    board_fire(b, game_event::MATCH_ATTEMPTED, attempt);

    path link;
    if (path_find(&b->g, b->cfg.rules, t1, t2, &link)) {
        board_eliminate(b, t1, t2, &link);
        return tap_result::ELIMINATED;
    }

    board_fire(b, game_event::MATCH_FAILED, attempt);
    board_clear_selection(b);
    return tap_result::REJECTED;
}

lk_err board_tap(board *b, i32 row, i32 col, tap_result *out) {
    tap_result res = tap_result::IGNORED;

    tile *t = grid_get(&b->g, row, col);
    if (t == nullptr) {
        if (out) *out = res;
        return lk_err::OUT_OF_BOUNDS;
    }

    if (!tile_is_empty(t)) {
        // A resolved pair always empties the set, so a full set here is stale
        if (b->num_selected >= 2) {
            board_clear_selection(b);
        }

        if (t->state == tile_state::SELECTED) {
            board_deselect(b, t);
            res = tap_result::DESELECTED;
        } else {
            t->state = tile_state::SELECTED;
            b->selected[b->num_selected++] = t;

            tile_event evt = tile_event_of(t);
            board_fire(b, game_event::TILE_SELECTED, evt);

            res = b->num_selected == 2 ? board_resolve_pair(b) : tap_result::SELECTED;
        }
    }

    if (out) *out = res;
    return lk_err::NONE;
}

u32 board_tick(board *b) {
    u32 handled = 0;
    tap_input tap;
    while (b->api->input_next_tap(b->api->input, &tap)) {
        lk_err err = board_tap(b, tap.row, tap.col);
        if (err != lk_err::NONE) {
            printf("[LINK] ignoring tap at (%d, %d): %s\n", tap.row, tap.col, lk_err_name(err));
            continue;
        }
        handled++;
    }
    return handled;
}
