#pragma once
#include "shared_types.hpp"

#define INPUT_MAX_TAPS 32  // Must be power of 2!
#define INPUT_TAP_MASK (INPUT_MAX_TAPS - 1)

// A tap on a grid slot, already resolved from screen space by the host
struct tap_input {
    i32 row;
    i32 col;
};

struct input_state {
    tap_input taps[INPUT_MAX_TAPS];
    u32 head;       // next tap to hand out
    u32 tail;       // next free slot
    u32 dropped;    // taps refused because the queue was full
};

// Engine-internal (not exposed through the api table)
void input_init(input_state* state);
void input_clear(input_state* state);

// Exposed to game
bool input_tap(input_state* state, i32 row, i32 col);
bool input_next_tap(input_state* state, tap_input* out);
u32 input_pending(input_state* state);
