#pragma once
#include "shared.hpp"

#define ENGINE_DEFAULT_BUS_ARENA (256 * 1024)

// Allocates the bus and input queue and points every api entry at the engine implementation
bool engine_init(engine_api *api, u64 bus_arena_capacity = ENGINE_DEFAULT_BUS_ARENA);
void engine_free(engine_api *api);
