/*
 * FILE: placement_engine.h
 *
 * WHAT:
 * Defines the interface for the Placement Engine: the randomized backtracking
 * search that lays a set of words out on a rows x cols board so that every
 * word after the first crosses an already placed word.
 *
 * ALGORITHM (per restart, up to `max_restarts` restarts):
 * 1. Shuffle the words. Directions alternate by shuffled index
 *    (0 = Across, 1 = Down, 2 = Across, ...).
 * 2. Seed: the first word straddles the board centre. Offsets {0,-1,+1,-2,+2}
 *    are tried on the row (outer) and column (inner); the first legal one wins.
 * 3. Extension: each following word collects every start cell that would put
 *    one of its letters on a matching letter already on the board, shuffles
 *    that list and tries each legal, overlapping candidate depth first.
 * 4. The first complete placement is numbered and returned.
 */

#pragma once
#ifndef PLACEMENT_ENGINE_H
#define PLACEMENT_ENGINE_H
#include "crossword_types.h"
#include "random_source.h"

/*
 * STRUCT: generator_options_t
 *
 * WHAT:
 * Per call settings for generate_crossword.
 * - max_restarts     : restart budget (default CROSSWORD_MAX_RESTARTS).
 * - parallel_restarts: spread restarts over OpenMP threads. The first layout
 *                      any thread completes wins, so output is not
 *                      reproducible even with a seeded source.
 * - verbose          : print a one line summary to stdout.
 */
typedef struct _generator_options
{
    int max_restarts;
    bool parallel_restarts;
    bool verbose;
} generator_options_t;

// Options with the default budget, serial search and no console output.
generator_options_t generator_options_defaults(void);

/*
 * TYPE: crossword_generator_fn
 *
 * WHAT:
 * The signature of generate_crossword. The Selection Driver calls the engine
 * through this pointer so another engine (or an instrumented one) can be
 * substituted.
 */
typedef bool (*crossword_generator_fn)(const crossword_word_t* const* pp_words,
    int word_count,
    int rows,
    int cols,
    random_source_t* p_random,
    const generator_options_t* p_options,
    crossword_layout_t* p_layout);

/*
 * FUNCTION: generate_crossword
 *
 * WHAT:
 * Places every word of `pp_words` on a rows x cols board.
 *
 * PARAMETERS:
 * - pp_words  : the words to place. Entries of the result point at these
 *               structs, so they must outlive the layout.
 * - word_count: number of words, > 0.
 * - rows, cols: board size, 1..CROSSWORD_MAX_BOARD_SIZE.
 * - p_random  : random source used for shuffles.
 * - p_options : NULL means generator_options_defaults().
 * - p_layout  : receives the layout. Always initialized; on failure it is
 *               the empty layout (entry_count == 0).
 *
 * RETURNS:
 * - true when every word was placed.
 * - false when the restart budget ran out (an expected outcome), when the
 *   arguments are invalid, or when memory ran out. The latter two are
 *   reported on stderr.
 */
bool generate_crossword(const crossword_word_t* const* pp_words,
    int word_count,
    int rows,
    int cols,
    random_source_t* p_random,
    const generator_options_t* p_options,
    crossword_layout_t* p_layout);

/*
 * FUNCTION: assign_entry_numbers
 *
 * WHAT:
 * Finalization pass. Scans the board row-major for cells where some entry
 * starts and numbers them 1, 2, 3... in scan order. Every entry gets the
 * number of its start cell and the id "A<n>" or "D<n>".
 */
bool assign_entry_numbers(crossword_layout_t* p_layout);

// Releases the entries of a layout and resets it to the empty layout.
void crossword_layout_free(crossword_layout_t* p_layout);

#endif
