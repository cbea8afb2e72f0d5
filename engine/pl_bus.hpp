#pragma once
#include "shared_types.hpp"
#include "pl_memory.hpp"

enum class event_type : u16 {
    NONE = 0,

    // ENGINE EVENTS (1-31)
    BUS_OVERFLOW,       // fired on the next process after events were dropped

    ENGINE_RESERVED_END = 31,

    // GAME EVENTS (32-63)
    // Game layers declare their own enum starting here and cast on fire/subscribe:
    //   enum class game_event : u16 {
    //       TILE_SELECTED = (u16)event_type::GAME_EVENTS_START,
    //       ...
    //   };
    GAME_EVENTS_START = 32,

    COUNT = 64  // Total capacity for all event types
};

// ===== ENGINE EVENT DATA STRUCTURES =====

struct bus_overflow_event {
    u32 dropped;
};

// ===== EVENT HANDLER =====

// Event handler signature: receives event type, payload copy and the subscriber's user_data
typedef void (*event_handler_fn)(event_type type, void* data, void* user_data);

// Handler ID that encodes generation, slot index, and event type
struct handler_id {
    union {
        u64 packed;
        struct {
            u32 generation;  // Must match slot's generation to be valid
            u16 slot_idx;    // Which slot in the handlers array
            u16 type_idx;    // Event type index
        };
    };
};

#define INVALID_HANDLER_ID (handler_id{0})

#define BUS_MAX_HANDLERS_PER_TYPE 16
#define BUS_MAX_EVENTS_PER_FRAME 256  // Must be power of 2!
#define BUS_EVENT_MASK (BUS_MAX_EVENTS_PER_FRAME - 1)

// Safety limit to prevent infinite event loops
#define BUS_MAX_EVENTS_PER_PROCESS (BUS_MAX_EVENTS_PER_FRAME * 2)

struct event_entry {
    event_type type;
    arena_ptr data;
    u32 data_size;
};

struct event_handler {
    event_handler_fn fn;
    void* user_data;
    u32 generation;  // Incremented each time this slot is reused
    bool active;
};

struct event_bus {
    // Ring buffer for event queue
    event_entry events[BUS_MAX_EVENTS_PER_FRAME];
    u32 head;  // Next event to process
    u32 tail;  // Next free slot
    u32 dropped;  // Fires refused since the last process

    event_handler handlers[(u32)event_type::COUNT][BUS_MAX_HANDLERS_PER_TYPE];
    u32 handler_counts[(u32)event_type::COUNT];

    // Memory for event data
    mem_arena event_arena;
};

void bus_init(event_bus* bus, u64 arena_capacity);
void bus_free(event_bus* bus);

// Returns INVALID_HANDLER_ID when the type is out of range or all slots are taken
handler_id bus_subscribe(event_bus* bus, event_type type, event_handler_fn handler, void* user_data = nullptr);

// False if handler_id is invalid or stale
bool bus_unsubscribe(event_bus* bus, handler_id id);

// Copies data into the bus arena. False if queue or arena is full.
// Safe to call from handlers, those events are dispatched in the same bus_process.
bool bus_fire(event_bus* bus, event_type type, const void* data, u32 data_size);

// Type-safe firing through an engine_api table
// Usage: bus_fire_event(api, game_event::BOARD_REFILLED, my_event_struct)
#define bus_fire_event(api, type, event_data) \
    (api)->bus_fire((api)->bus, (event_type)(type), &(event_data), sizeof(event_data))

// Dispatch every queued event, then reset
void bus_process(event_bus* bus);

// Drop queued events and reset the arena
void bus_reset(event_bus* bus);

static inline u32 bus_pending(event_bus* bus) {
    return bus->tail - bus->head;
}
