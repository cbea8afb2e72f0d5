#include "pl_config.hpp"
#include "pl_memory.hpp"
#include "pl_parse.hpp"

#include "SDL3/SDL.h"
#include <cstdio>

#define CONFIG_ALLOC_SIZE 1024*4

static const char *config_copy_str(config *c, strview s) {
    arena_ptr p = mem_arena_alloc(&c->_mem_vals, s.len + 1, 1);
    if (p.p == nullptr) return nullptr;

    memcpy(p.p, s.ptr, s.len);
    p.p[s.len] = '\0';
    return (const char*)p.p;
}

static bool config_parse_value(config *c, strview r, config_value *val) {
    if (r.ptr[0] == '[') {
        val->type = value_type::RANGE;
        strview inner { r.ptr + 1, r.len - 1 };
        if (inner.len > 0 && inner.ptr[inner.len - 1] == ']') inner.len--;

        strview min, max;
        if (!sv_split_once(inner, ",", &min, &max)) return false;
        return sv_to_i32(min, &val->range.min) && sv_to_i32(max, &val->range.max);
    }
    else if (r.ptr[0] == '"') {
        if (r.len < 2 || r.ptr[r.len - 1] != '"') return false;

        val->type = value_type::STRING;
        strview content { r.ptr + 1, r.len - 2 };
        val->str.arr = config_copy_str(c, content);
        val->str.len = content.len;
        return val->str.arr != nullptr;
    }
    else if (sv_find(r, ",").ptr) {
        val->type = value_type::ARRAY;
        strview elem[CONFIG_MAX_ARRAY];
        u64 num = sv_split(r, ",", elem, CONFIG_MAX_ARRAY);
        if (num == 0) return false;

        val->array.arr = (i32*)mem_arena_alloc(&c->_mem_vals, sizeof(i32) * num).p;
        if (val->array.arr == nullptr) return false;
        for (u64 i = 0; i < num; i++) {
            if (!sv_to_i32(elem[i], &val->array.arr[i])) return false;
        }
        val->array.len = num;
        return true;
    }

    val->type = value_type::SINGLE;
    return sv_to_i32(r, &val->single);
}

void config_init_text(config *c, const char *text, u64 len) {
    c->num_entries = 0;
    mem_arena_init(&c->_mem_vals, CONFIG_ALLOC_SIZE);

    strview rest { text, (size_t)len };
    while (rest.len > 0) {
        strview line, next;
        if (!sv_split_once(rest, "\n", &line, &next)) {
            line = rest;
            next = { rest.ptr + rest.len, 0 };
        }
        rest = next;

        line = sv_trim(line);
        if (line.len == 0 || line.ptr[0] == '#') {
            continue;
        }

        strview l, r;
        if (!sv_split_once(line, "=", &l, &r)) {
            printf("[PL] config: skipping line without '=': " SV_FMT "\n", SV_ARG(line));
            continue;
        }
        l = sv_trim(l);
        r = sv_trim(r);
        if (l.len == 0 || r.len == 0) continue;

        if (c->num_entries >= CONFIG_NUM_KEYS) {
            printf("[PL] config: more than %d keys, ignoring the rest\n", CONFIG_NUM_KEYS);
            break;
        }

        config_value *val = (config_value*)mem_arena_alloc(&c->_mem_vals, sizeof(config_value)).p;
        const char *key = config_copy_str(c, l);
        if (val == nullptr || key == nullptr) {
            printf("[PL] config: out of memory while reading '" SV_FMT "'\n", SV_ARG(l));
            break;
        }

        if (!config_parse_value(c, r, val)) {
            printf("[PL] config: bad value for '%s': " SV_FMT "\n", key, SV_ARG(r));
            continue;
        }

        c->keys[c->num_entries] = key;
        c->values[c->num_entries++] = val;
    }
}

bool config_init(config *c, const char *file) {
    size_t file_size = 0;
    char *content = (char *)SDL_LoadFile(file, &file_size);
    if (content == nullptr) {
        printf("[PL] config: could not load %s: %s\n", file, SDL_GetError());
        config_init_text(c, "", 0);
        return false;
    }

    config_init_text(c, content, file_size);
    SDL_free(content);
    return true;
}

void config_free(config *c) {
    mem_arena_clear(&c->_mem_vals);
    c->num_entries = 0;
}

bool config_read(config *c, const char *key, config_value *out) {
    // Later entries override earlier ones
    for (u64 i = c->num_entries; i > 0; i--) {
        if (strcmp(c->keys[i - 1], key) == 0) {
            *out = *c->values[i - 1];
            return true;
        }
    }

    return false;
}
