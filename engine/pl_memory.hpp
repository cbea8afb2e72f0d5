#pragma once
#include "shared_types.hpp"

#include <cassert>

void *pl_malloc(u64 sz);
void *pl_calloc(u64 count, u64 sz);
void pl_free(void *ptr);

struct mem_arena {
    u8 *base = nullptr;
    u64 next = 0;
    u64 cap = 0;
    u64 peak = 0;   // high-water mark across resets
    u64 gen = 0;
};

struct arena_ptr {
    u8 *p;
    u64 gen;
};

bool mem_arena_init(mem_arena *arena, u64 max_size);
void mem_arena_reset(mem_arena *arena);
void mem_arena_clear(mem_arena *arena);

// Returns { nullptr, gen } when the arena cannot fit the request
arena_ptr mem_arena_alloc(mem_arena *arena, u64 size, u64 align = sizeof(void *));

template<class T>
static inline T *mem_arena_get(mem_arena *arena, arena_ptr ptr) {
    assert(arena->gen == ptr.gen && "Trying to access stale pointer in arena");
    return reinterpret_cast<T *>(ptr.p);
}
