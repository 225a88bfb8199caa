/*
 * FILE: random_source.h
 *
 * WHAT:
 * Defines the injectable random number source used by the Placement Engine
 * and the Selection Driver.
 *
 * A random_source_t is a function pointer plus an opaque state block. The
 * built-in source wraps a 32-bit Mersenne Twister; tests can construct one
 * with a fixed seed (reproducible layouts) or plug in their own `next_u32`.
 */

#pragma once
#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <stdint.h>
#include <stdbool.h>

/*
 * STRUCT: random_source_t
 *
 * WHAT:
 * - next_u32: returns the next uniformly distributed 32-bit value.
 * - p_state : passed to next_u32 unchanged. Owned by whoever created the source.
 */
typedef struct _random_source
{
    uint32_t (*next_u32)(void* p_state);
    void* p_state;
} random_source_t;

/*
 * FUNCTION: random_source_create_seeded
 *
 * WHAT:
 * Initializes `p_source` with a Mersenne Twister seeded by `seed`.
 * The same seed always yields the same sequence.
 *
 * RETURNS:
 * - false if the generator state could not be allocated.
 */
bool random_source_create_seeded(random_source_t* p_source, uint32_t seed);

/*
 * FUNCTION: random_source_create_default
 *
 * WHAT:
 * Initializes `p_source` with a Mersenne Twister seeded from the platform
 * entropy source. Output differs from run to run.
 */
bool random_source_create_default(random_source_t* p_source);

/*
 * FUNCTION: random_source_free
 *
 * WHAT:
 * Releases a source made by one of the create functions above and clears it.
 * Safe to call on a source whose state is already NULL.
 */
void random_source_free(random_source_t* p_source);

/*
 * FUNCTION: parse_seed_text
 *
 * WHAT:
 * Reads a decimal seed given on the command line. The text must be one or
 * more digits and fit in 32 bits; signs, blanks and trailing characters are
 * rejected. *p_seed is only written on success.
 */
bool parse_seed_text(const char* text, uint32_t* p_seed);

// Draws a value in [0, bound). bound must be > 0. Rejection sampling keeps it unbiased.
uint32_t random_below(random_source_t* p_source, uint32_t bound);

// Fisher-Yates shuffle of `count` ints in place.
void shuffle_int_array(random_source_t* p_source, int* p_values, int count);

#endif
