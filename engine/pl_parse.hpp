#pragma once
#include "shared_types.hpp"

#include <cstring>

#define SV_FMT "%.*s"
#define SV_ARG(sv) (int)sv.len, sv.ptr

struct strview {
    const char* ptr;
    size_t len;
};

static inline strview sv(const char *s) {
    return { s, strlen(s) };
}

static inline bool sv_eq(strview a, const char *b) {
    size_t n = strlen(b);
    return a.len == n && memcmp(a.ptr, b, n) == 0;
}

strview sv_find(strview haystack, const char *needle);

// Returns 0 when there are more than max_elems pieces
u64 sv_split(strview str, const char *delim, strview *out_elems, u64 max_elems);

bool sv_split_once(strview str, const char *delim, strview* first, strview* second);

// Strips spaces, tabs and line endings on both sides
strview sv_trim(strview str);

// Whole view must be an optionally signed decimal integer
bool sv_to_i32(strview str, i32 *out);
