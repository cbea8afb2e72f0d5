#include "pl_memory.hpp"
#include <cstdio>
#include <cstdlib>

void *pl_malloc(u64 size) {
    return malloc(size);
}

void *pl_calloc(u64 count, u64 size) {
    return calloc(count, size);
}

void pl_free(void *ptr) {
    free(ptr);
}

// MEMORY ARENA -----------------------------------

static inline u64 align_fwd(u64 ptr, u64 align) {
    assert((align & (align - 1)) == 0 && "alignment must be power of two");

    u64 m = align - 1;
    return (ptr + m) & ~m;
}

bool mem_arena_init(mem_arena *arena, u64 max_size) {
    arena->base = (u8*)pl_malloc(max_size);
    arena->next = 0;
    arena->peak = 0;
    if (arena->base == nullptr) {
        printf("[PL] mem_arena: could not reserve %llu bytes\n", (unsigned long long)max_size);
        arena->cap = 0;
        return false;
    }
    arena->cap = max_size;
    return true;
}

void mem_arena_reset(mem_arena *arena) {
    arena->next = 0;
    arena->gen++;
}

void mem_arena_clear(mem_arena *arena) {
    pl_free(arena->base);
    arena->base = nullptr;

    arena->next = 0;
    arena->cap = 0;
    arena->gen++;
}

arena_ptr mem_arena_alloc(mem_arena *arena, u64 size, u64 align) {
    u64 off = align_fwd(arena->next, align);

    if (arena->base == nullptr || off + size > arena->cap) {
        return { nullptr, arena->gen };
    }
    u8 *ptr = arena->base + off;
    arena->next = off + size;
    if (arena->next > arena->peak) arena->peak = arena->next;
    return { ptr, arena->gen };
}
