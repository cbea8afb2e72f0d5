#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include "SDL3/SDL.h"

#include "shared.hpp"
#include "pl_bus.hpp"
#include "pl_config.hpp"
#include "pl_engine.hpp"
#include "pl_input.hpp"
#include "lk_board.hpp"
#include "lk_events.hpp"

struct cli_args {
    const char *config_path;
    i32 num_boards;
    i64 seed;
    bool verbose;
};

static void cli_usage() {
    printf("Usage: pairlink_autoplay [options]\n");
    printf("  -c <path>    Config file (default: assets/pairlink.cfg)\n");
    printf("  -n <count>   Number of boards to play\n");
    printf("  -s <seed>    RNG seed (0 = random)\n");
    printf("  -v           Verbose output\n");
}

static bool cli_parse(cli_args *args, int argc, char **argv) {
    args->config_path = "assets/pairlink.cfg";
    args->num_boards = 0;
    args->seed = 0;
    args->verbose = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            args->config_path = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            args->num_boards = atoi(argv[++i]);
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            args->seed = atoll(argv[++i]);
        } else if (strcmp(argv[i], "-v") == 0) {
            args->verbose = true;
        } else {
            cli_usage();
            return false;
        }
    }
    return true;
}

struct autoplay_stats {
    u32 pairs;
    u32 rejected;
    u32 refills;
    u32 dropped[(u32)tile_type::COUNT];
    bool verbose;
};

static void on_tiles_eliminated(event_type type, void *data, void *user_data) {
    auto *stats = (autoplay_stats*)user_data;
    auto *evt = (tiles_eliminated_event*)data;

    stats->pairs++;
    if (evt->drops_resource) {
        stats->dropped[(u32)evt->type] += 2;
    }
    if (stats->verbose) {
        printf("  pair %s (%d,%d)-(%d,%d) bends=%d\n", tile_type_name(evt->type),
               evt->a.row, evt->a.col, evt->b.row, evt->b.col, path_bends(&evt->link));
    }
}

static void on_match_failed(event_type type, void *data, void *user_data) {
    ((autoplay_stats*)user_data)->rejected++;
}

static void on_board_refilled(event_type type, void *data, void *user_data) {
    auto *stats = (autoplay_stats*)user_data;
    auto *evt = (board_refilled_event*)data;

    stats->refills++;
    if (stats->verbose) {
        printf("[AUTOPLAY] board cleared, refill #%u\n", evt->refill_count);
    }
}

int main(int argc, char **argv) {
    cli_args args;
    if (!cli_parse(&args, argc, argv)) return 1;

    engine_api api {};
    if (!engine_init(&api)) {
        printf("ERROR: engine init failed\n");
        return 1;
    }

    config cfg = {};
    if (!api.config_init(&cfg, args.config_path)) {
        printf("[AUTOPLAY] no config at %s, using defaults\n", args.config_path);
    }

    config_value val;
    if (args.num_boards == 0) {
        args.num_boards = 10;
        if (api.config_read(&cfg, "num_boards", &val) && val.type == value_type::SINGLE) args.num_boards = val.single;
    }
    if (args.seed == 0) {
        if (api.config_read(&cfg, "seed", &val) && val.type == value_type::SINGLE && val.single != 0) {
            args.seed = val.single;
        } else {
            args.seed = (i64)time(nullptr);
        }
    }
    i32 max_taps = 100000;
    if (api.config_read(&cfg, "max_taps", &val) && val.type == value_type::SINGLE) max_taps = val.single;

    board_config bcfg;
    board_config_default(&bcfg);
    lk_err err = board_config_from_config(&bcfg, &api, &cfg);
    api.config_free(&cfg);
    if (args.verbose) bcfg.verbose = true;

    if (err != lk_err::NONE) {
        printf("ERROR: bad configuration in %s: %s\n", args.config_path, lk_err_name(err));
        engine_free(&api);
        return 1;
    }

    printf("pairlink_autoplay %s: seed=%lld boards=%d grid=%dx%d types=%d bends=%d wrap=%d\n",
           PAIRLINK_VERSION, (long long)args.seed, args.num_boards, bcfg.width, bcfg.height,
           bcfg.num_types, bcfg.rules.max_bends, bcfg.rules.border_wrap ? 1 : 0);

    api.rand_seed(args.seed);

    autoplay_stats stats = {};
    stats.verbose = args.verbose;
    bus_subscribe_game(&api, game_event::TILES_ELIMINATED, on_tiles_eliminated, &stats);
    bus_subscribe_game(&api, game_event::MATCH_FAILED, on_match_failed, &stats);
    bus_subscribe_game(&api, game_event::BOARD_REFILLED, on_board_refilled, &stats);

    board brd_storage;
    board *brd = &brd_storage;
    err = board_init(brd, &api, &bcfg);
    if (err != lk_err::NONE) {
        printf("ERROR: board init failed: %s\n", lk_err_name(err));
        engine_free(&api);
        return 1;
    }

    u64 start_ns = SDL_GetTicksNS();
    i32 taps = 0;
    i32 stuck = 0;

    while ((i32)stats.refills + stuck < args.num_boards && taps < max_taps) {
        tile *a, *b;
        if (!path_find_any_pair(&brd->g, brd->cfg.rules, &a, &b)) {
            stuck++;
            printf("[AUTOPLAY] dead end with %d tile(s) left\n", grid_occupied_count(&brd->g));
            if (args.verbose) grid_dump(&brd->g, stdout);

            err = board_init(brd, &api, &bcfg);
            if (err != lk_err::NONE) break;
            continue;
        }

        if (!api.input_tap(api.input, a->row, a->col) || !api.input_tap(api.input, b->row, b->col)) {
            printf("ERROR: input queue full\n");
            break;
        }
        taps += 2;

        board_tick(brd);
        api.bus_process(api.bus);
    }

    f64 elapsed_ms = (f64)(SDL_GetTicksNS() - start_ns) / 1e6;

    printf("Summary: %u cleared, %d dead end(s), %u pairs, %u rejected, %d taps in %.2f ms\n",
           stats.refills, stuck, stats.pairs, stats.rejected, taps, elapsed_ms);
    for (u32 t = 1; t < (u32)tile_type::COUNT; t++) {
        if (stats.dropped[t] > 0) {
            printf("  dropped %-8s %u\n", tile_type_name((tile_type)t), stats.dropped[t]);
        }
    }
    if (args.verbose) {
        const mem_arena &arena = api.bus->event_arena;
        printf("[AUTOPLAY] bus arena peak %llu of %llu bytes\n",
               (unsigned long long)arena.peak, (unsigned long long)arena.cap);
    }

    engine_free(&api);
    return err == lk_err::NONE ? 0 : 1;
}
