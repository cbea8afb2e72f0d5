#pragma once
#include "shared_types.hpp"

typedef i32 (*rand_int_fn)(i32);

void rand_seed(i64 seed);

// [0, max_val)
i32 rand_int(i32 max_val);

// Fisher-Yates, drawing from the given source so callers can script the permutation
template<class T>
void rand_shuffle(T *items, i32 num_items, rand_int_fn rand_fn) {
    for (i32 i = num_items - 1; i > 0; i--) {
        i32 j = rand_fn(i + 1);
        T tmp = items[i];
        items[i] = items[j];
        items[j] = tmp;
    }
}
