#include "pl_bus.hpp"
#include <cstdio>
#include <cstring>

void bus_init(event_bus* bus, u64 arena_capacity) {
    mem_arena_init(&bus->event_arena, arena_capacity);

    bus->head = 0;
    bus->tail = 0;
    bus->dropped = 0;

    for (u32 i = 0; i < (u32)event_type::COUNT; i++) {
        bus->handler_counts[i] = 0;
        for (u32 j = 0; j < BUS_MAX_HANDLERS_PER_TYPE; j++) {
            bus->handlers[i][j].fn = nullptr;
            bus->handlers[i][j].user_data = nullptr;
            bus->handlers[i][j].generation = 0;
            bus->handlers[i][j].active = false;
        }
    }
}

void bus_free(event_bus* bus) {
    mem_arena_clear(&bus->event_arena);
}

handler_id bus_subscribe(event_bus* bus, event_type type, event_handler_fn handler, void* user_data) {
    u32 type_idx = (u32)type;

    if (type_idx == 0 || type_idx >= (u32)event_type::COUNT || handler == nullptr) {
        return INVALID_HANDLER_ID;
    }

    u32 slot = BUS_MAX_HANDLERS_PER_TYPE;
    for (u32 i = 0; i < BUS_MAX_HANDLERS_PER_TYPE; i++) {
        if (!bus->handlers[type_idx][i].active) {
            slot = i;
            break;
        }
    }

    if (slot == BUS_MAX_HANDLERS_PER_TYPE) {
        return INVALID_HANDLER_ID;
    }

    // Bump generation so ids from a previous occupant go stale
    event_handler& h = bus->handlers[type_idx][slot];
    h.generation++;
    h.fn = handler;
    h.user_data = user_data;
    h.active = true;
    bus->handler_counts[type_idx]++;

    handler_id id;
    id.generation = h.generation;
    id.slot_idx = (u16)slot;
    id.type_idx = (u16)type_idx;

    return id;
}

bool bus_unsubscribe(event_bus* bus, handler_id id) {
    if (id.packed == 0) {
        return false;
    }

    u16 type_idx = id.type_idx;
    u16 slot_idx = id.slot_idx;

    if (type_idx >= (u32)event_type::COUNT || slot_idx >= BUS_MAX_HANDLERS_PER_TYPE) {
        return false;
    }

    event_handler& handler = bus->handlers[type_idx][slot_idx];

    if (!handler.active || handler.generation != id.generation) {
        return false;
    }

    handler.active = false;
    handler.fn = nullptr;
    handler.user_data = nullptr;
    bus->handler_counts[type_idx]--;

    return true;
}

bool bus_fire(event_bus* bus, event_type type, const void* data, u32 data_size) {
    if (bus_pending(bus) >= BUS_MAX_EVENTS_PER_FRAME) {
        bus->dropped++;
        return false;
    }

    arena_ptr event_data = { nullptr, bus->event_arena.gen };
    if (data_size > 0) {
        event_data = mem_arena_alloc(&bus->event_arena, data_size, alignof(void*));
        if (event_data.p == nullptr) {
            bus->dropped++;
            return false;
        }
        if (data) {
            memcpy(event_data.p, data, data_size);
        }
    }

    event_entry& entry = bus->events[bus->tail & BUS_EVENT_MASK];
    entry.type = type;
    entry.data = event_data;
    entry.data_size = data_size;

    bus->tail++;

    return true;
}

static void bus_dispatch(event_bus* bus, event_type type, void* data) {
    u32 type_idx = (u32)type;
    if (type_idx >= (u32)event_type::COUNT || bus->handler_counts[type_idx] == 0) {
        return;
    }

    for (u32 j = 0; j < BUS_MAX_HANDLERS_PER_TYPE; j++) {
        event_handler& handler = bus->handlers[type_idx][j];
        if (handler.active && handler.fn) {
            handler.fn(type, data, handler.user_data);
        }
    }
}

void bus_process(event_bus* bus) {
    u32 events_processed = 0;

    if (bus->dropped > 0) {
        printf("[PL] bus: %u event(s) dropped since last process\n", bus->dropped);
        bus_overflow_event overflow { bus->dropped };
        bus->dropped = 0;
        bus_dispatch(bus, event_type::BUS_OVERFLOW, &overflow);
    }

    // Handlers may fire new events, which extend tail
    while (bus->head < bus->tail) {
        if (events_processed >= BUS_MAX_EVENTS_PER_PROCESS) {
            printf("[PL] bus: more than %d events in one process, discarding %u\n",
                   BUS_MAX_EVENTS_PER_PROCESS, bus_pending(bus));
            break;
        }

        event_entry& evt = bus->events[bus->head & BUS_EVENT_MASK];
        bus_dispatch(bus, evt.type, mem_arena_get<u8>(&bus->event_arena, evt.data));

        bus->head++;
        events_processed++;
    }

    bus_reset(bus);
}

void bus_reset(event_bus* bus) {
    bus->head = 0;
    bus->tail = 0;
    mem_arena_reset(&bus->event_arena);
}
