#pragma once
#include "shared_types.hpp"

enum class direction : u8 {
    UP = 0,
    RIGHT = 1,
    DOWN = 2,
    LEFT = 3,
    COUNT = 4
};

// x = column, y = row
struct ivec2 {
    i32 x;
    i32 y;
};

// Arithmetic
inline ivec2 operator+(ivec2 a, ivec2 b) { return {a.x + b.x, a.y + b.y}; }

// Comparison
inline bool operator==(ivec2 a, ivec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(ivec2 a, ivec2 b) { return !(a == b); }

// Unit step from a toward b; zero vector unless a and b share a row or column
inline ivec2 ivec2_step_toward(ivec2 a, ivec2 b) {
    if (a.x != b.x && a.y != b.y) return {0, 0};
    return { (b.x > a.x) - (b.x < a.x), (b.y > a.y) - (b.y < a.y) };
}

// Direction constants
constexpr ivec2 ivec2_zero  = { 0,  0};
constexpr ivec2 ivec2_up    = { 0, -1};
constexpr ivec2 ivec2_right = { 1,  0};
constexpr ivec2 ivec2_down  = { 0,  1};
constexpr ivec2 ivec2_left  = {-1,  0};

// Indexed by direction enum
constexpr ivec2 direction_vectors[] = {
    ivec2_up,
    ivec2_right,
    ivec2_down,
    ivec2_left,
};
