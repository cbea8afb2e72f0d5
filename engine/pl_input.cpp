#include "pl_input.hpp"

void input_init(input_state* state) {
    state->head = 0;
    state->tail = 0;
    state->dropped = 0;
}

void input_clear(input_state* state) {
    state->head = state->tail;
}

bool input_tap(input_state* state, i32 row, i32 col) {
    if (state->tail - state->head >= INPUT_MAX_TAPS) {
        state->dropped++;
        return false;
    }

    state->taps[state->tail & INPUT_TAP_MASK] = { row, col };
    state->tail++;
    return true;
}

bool input_next_tap(input_state* state, tap_input* out) {
    if (state->head == state->tail) {
        return false;
    }

    *out = state->taps[state->head & INPUT_TAP_MASK];
    state->head++;
    return true;
}

u32 input_pending(input_state* state) {
    return state->tail - state->head;
}
