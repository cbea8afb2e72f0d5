#include "pl_parse.hpp"

strview sv_find(strview haystack, const char *needle) {
    strview n = sv(needle);
    if (n.len == 0 || n.len > haystack.len) {
        return { nullptr, 0 };
    }

    for (size_t i = 0; i <= haystack.len - n.len; i++) {
        if (memcmp(haystack.ptr + i, n.ptr, n.len) == 0) {
            return { haystack.ptr + i, n.len };
        }
    }

    return { nullptr, 0 };
}

u64 sv_split(strview str, const char *delim, strview *out_elems, u64 max_elems) {
    u64 pos = 0;
    u64 num_elems = 0;
    size_t delim_len = strlen(delim);

    while (pos < str.len) {
        if (num_elems >= max_elems) return 0; // Found too many delims

        strview rest{ str.ptr + pos, str.len - pos };
        strview found = sv_find(rest, delim);

        if (found.ptr == nullptr) {
            out_elems[num_elems++] = rest;
            break;
        }

        size_t end = (size_t)(found.ptr - str.ptr);
        out_elems[num_elems++] = { str.ptr + pos, end - pos };
        pos = end + delim_len; // skip over the whole delimiter
    }

    return num_elems;
}

bool sv_split_once(strview str, const char *delim, strview* first, strview* second) {
    strview d = sv(delim);
    strview found = sv_find(str, delim);
    if (found.ptr == nullptr) {
        return false;
    }

    size_t pos = found.ptr - str.ptr;

    *first = { str.ptr, pos };
    *second = { found.ptr + d.len, str.len - pos - d.len };
    return true;
}

static inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

strview sv_trim(strview str) {
    while (str.len > 0 && is_blank(str.ptr[0])) {
        str.ptr++;
        str.len--;
    }
    while (str.len > 0 && is_blank(str.ptr[str.len - 1])) {
        str.len--;
    }
    return str;
}

bool sv_to_i32(strview str, i32 *out) {
    str = sv_trim(str);
    if (str.len == 0) return false;

    size_t i = 0;
    bool neg = false;
    if (str.ptr[0] == '-' || str.ptr[0] == '+') {
        neg = str.ptr[0] == '-';
        i++;
    }
    if (i == str.len) return false;

    // INT32_MIN has one more unit of magnitude than INT32_MAX
    i64 limit = (i64)INT32_MAX + (neg ? 1 : 0);
    i64 v = 0;
    for (; i < str.len; i++) {
        char c = str.ptr[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
        if (v > limit) return false;
    }
    *out = (i32)(neg ? -v : v);
    return true;
}
