#include "pl_engine.hpp"

#include "pl_bus.hpp"
#include "pl_config.hpp"
#include "pl_input.hpp"
#include "pl_memory.hpp"
#include "pl_parse.hpp"
#include "pl_random.hpp"

#include <cstdio>

bool engine_init(engine_api *api, u64 bus_arena_capacity) {
    #define X(ret, name, params) api->name = &name;
    BUS_MODULE_DEF
    CONFIG_MODULE_DEF
    INPUT_MODULE_DEF
    PARSE_MODULE_DEF
    RANDOM_MODULE_DEF
    #undef X

    api->bus = (event_bus*)pl_calloc(1, sizeof(event_bus));
    api->input = (input_state*)pl_calloc(1, sizeof(input_state));
    if (api->bus == nullptr || api->input == nullptr) {
        printf("[PL] engine: could not allocate bus/input\n");
        engine_free(api);
        return false;
    }

    bus_init(api->bus, bus_arena_capacity);
    if (api->bus->event_arena.base == nullptr) {
        engine_free(api);
        return false;
    }
    input_init(api->input);
    return true;
}

void engine_free(engine_api *api) {
    if (api->bus) {
        bus_free(api->bus);
        pl_free(api->bus);
        api->bus = nullptr;
    }
    if (api->input) {
        pl_free(api->input);
        api->input = nullptr;
    }
}
