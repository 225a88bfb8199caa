/*
 * FILE: random_source.cpp
 *
 * WHAT:
 * Implements the built-in random source (std::mt19937) and the helpers that
 * consume any random_source_t: bounded draws and in-place shuffles.
 */

#include "random_source.h"
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <ctype.h>
#include <new>
#include <random>

typedef std::mt19937 engine_t;

/*
 * FUNCTION: mt_next_u32
 *
 * WHAT:
 * The `next_u32` callback for the built-in source. `p_state` is the
 * std::mt19937 allocated by the create functions.
 */
static uint32_t mt_next_u32(void* p_state)
{
    engine_t* pEngine = (engine_t*)p_state;
    return (uint32_t)(*pEngine)();
}

bool random_source_create_seeded(random_source_t* p_source, uint32_t seed)
{
    if (p_source == NULL) return false;

    void* pMemory = malloc(sizeof(engine_t));
    if (pMemory == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating random generator!\n");
        p_source->next_u32 = NULL;
        p_source->p_state = NULL;
        return false;
    }
    engine_t* pEngine = new (pMemory) engine_t(seed);

    p_source->next_u32 = mt_next_u32;
    p_source->p_state = pEngine;
    return true;
}

bool random_source_create_default(random_source_t* p_source)
{
    std::random_device device;
    return random_source_create_seeded(p_source, (uint32_t)device());
}

void random_source_free(random_source_t* p_source)
{
    if (p_source == NULL) return;

    // Only the built-in source owns its state; custom sources manage their own.
    if (p_source->next_u32 == mt_next_u32 && p_source->p_state != NULL)
    {
        engine_t* pEngine = (engine_t*)p_source->p_state;
        pEngine->~engine_t();
        free(pEngine);
    }
    p_source->next_u32 = NULL;
    p_source->p_state = NULL;
}

bool parse_seed_text(const char* text, uint32_t* p_seed)
{
    // Digits only: no sign, no leading blanks.
    if (text == NULL || !isdigit((unsigned char)text[0])) return false;

    errno = 0;
    char* end = NULL;
    unsigned long long value = strtoull(text, &end, 10);
    if (errno == ERANGE || *end != '\0' || value > UINT32_MAX) return false;

    *p_seed = (uint32_t)value;
    return true;
}

uint32_t random_below(random_source_t* p_source, uint32_t bound)
{
    if (bound <= 1) return 0;

    // Discard the top sliver of the 32-bit range that would bias the modulo.
    uint32_t limit = UINT32_MAX - (UINT32_MAX % bound);
    uint32_t value;
    do
    {
        value = p_source->next_u32(p_source->p_state);
    } while (value >= limit);

    return value % bound;
}

void shuffle_int_array(random_source_t* p_source, int* p_values, int count)
{
    for (int i = count - 1; i > 0; i--)
    {
        int j = (int)random_below(p_source, (uint32_t)(i + 1));
        int tmp = p_values[i];
        p_values[i] = p_values[j];
        p_values[j] = tmp;
    }
}
