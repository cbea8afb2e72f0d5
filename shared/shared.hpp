#pragma once
#include "shared_types.hpp"

#define PAIRLINK_VERSION "0.3.0"

// ENGINE ======================================

enum class event_type : u16;
struct event_bus;
struct handler_id;
typedef void (*event_handler_fn)(event_type, void*, void*);
#define BUS_MODULE_DEF \
    X(void, bus_init, (event_bus*, u64)) \
    X(void, bus_free, (event_bus*)) \
    X(handler_id, bus_subscribe, (event_bus*, event_type, event_handler_fn, void*)) \
    X(bool, bus_unsubscribe, (event_bus*, handler_id)) \
    X(bool, bus_fire, (event_bus*, event_type, const void*, u32)) \
    X(void, bus_process, (event_bus*)) \
    X(void, bus_reset, (event_bus*))

enum class value_type : u8;
struct config_value;
struct config;
#define CONFIG_MODULE_DEF \
    X(bool, config_init, (config*, const char*)) \
    X(void, config_init_text, (config*, const char*, u64)) \
    X(void, config_free, (config*)) \
    X(bool, config_read, (config*, const char*, config_value*))

struct tap_input;
struct input_state;
#define INPUT_MODULE_DEF \
    X(bool, input_tap, (input_state*, i32, i32)) \
    X(bool, input_next_tap, (input_state*, tap_input*)) \
    X(u32, input_pending, (input_state*))

struct strview;
#define PARSE_MODULE_DEF \
    X(strview, sv_find, (strview, const char*)) \
    X(u64, sv_split, (strview, const char*, strview*, u64)) \
    X(bool, sv_split_once, (strview, const char*, strview*, strview*)) \
    X(strview, sv_trim, (strview))

#define RANDOM_MODULE_DEF \
    X(void, rand_seed, (i64)) \
    X(i32, rand_int, (i32))

// Services handed to the tile engine. Tests swap individual entries
// (rand_int in particular) to get scripted behaviour.
struct engine_api {
    #define X(ret, name, params) ret (*name) params;

    struct { BUS_MODULE_DEF };
    struct { CONFIG_MODULE_DEF };
    struct { INPUT_MODULE_DEF };
    struct { PARSE_MODULE_DEF };
    struct { RANDOM_MODULE_DEF };

    #undef X

    event_bus *bus;
    input_state *input;
};
