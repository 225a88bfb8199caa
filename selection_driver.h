/*
 * FILE: selection_driver.h
 *
 * WHAT:
 * Defines the interface for the Selection Driver: given a full word pool and a
 * difficulty tier, it picks a random subset of the tier's size and keeps
 * asking the Placement Engine for a layout until one holds every selected
 * word, or the attempt budget is spent.
 *
 * FLOW:
 * 1. Split the pool into usable (fits max(rows, cols)) and omitted words.
 * 2. Too few usable words -> SELECTION_INSUFFICIENT_WORDS, no placement attempted.
 * 3. Up to `max_attempts` times: shuffle usable, take the first N, generate.
 * 4. Nothing fit -> SELECTION_LAYOUT_NOT_FOUND.
 */

#pragma once
#ifndef SELECTION_DRIVER_H
#define SELECTION_DRIVER_H
#include "crossword_types.h"
#include "difficulty_tiers.h"
#include "placement_engine.h"
#include "random_source.h"

const int SELECTION_MESSAGE_LENGTH = 256;

/*
 * ENUM: selection_status_t
 *
 * WHAT:
 * - SELECTION_OK                : layout holds exactly required_count words.
 * - SELECTION_INSUFFICIENT_WORDS: usable pool smaller than the tier needs.
 *                                 Needs more words or a lower tier.
 * - SELECTION_LAYOUT_NOT_FOUND  : every attempt failed. Retrying may succeed.
 * - SELECTION_INVALID_ARGUMENT  : NULL pointers or an allocation failure.
 */
typedef enum _selection_status
{
    SELECTION_OK = 0,
    SELECTION_INSUFFICIENT_WORDS = 1,
    SELECTION_LAYOUT_NOT_FOUND = 2,
    SELECTION_INVALID_ARGUMENT = 3
} selection_status_t;

/*
 * STRUCT: selection_options_t
 *
 * WHAT:
 * - max_attempts: subset attempts (default CROSSWORD_MAX_SELECTION_ATTEMPTS).
 * - generator   : options forwarded to every engine call.
 * - generator_fn: the engine. NULL means generate_crossword.
 * - verbose     : log omitted / selected words and the outcome to stdout.
 */
typedef struct _selection_options
{
    int max_attempts;
    generator_options_t generator;
    crossword_generator_fn generator_fn;
    bool verbose;
} selection_options_t;

selection_options_t selection_options_defaults(void);

/*
 * STRUCT: selection_result_t
 *
 * WHAT:
 * The outcome of select_crossword. The three pointer arrays point into the
 * caller's pool (never copies) and keep pool order, except `p_selected`,
 * which is in the random order the words were drawn.
 *
 * usable/omitted are filled for every status except SELECTION_INVALID_ARGUMENT.
 * selected and layout are only filled for SELECTION_OK.
 */
typedef struct _selection_result
{
    selection_status_t status;
    difficulty_tier_t tier;
    int required_count;
    int attempts_used;                          /* Engine calls made               */
    crossword_layout_t layout;

    word_pointer_array_t p_selected;
    int selected_count;
    word_pointer_array_t p_usable;
    int usable_count;
    word_pointer_array_t p_omitted;
    int omitted_count;

    char message[SELECTION_MESSAGE_LENGTH];     /* Human readable outcome          */
} selection_result_t;

/*
 * FUNCTION: partition_word_pool
 *
 * WHAT:
 * Splits `p_pool` by answer length: <= max_length goes to usable, longer goes
 * to omitted. Both arrays are allocated here (possibly zero length but never
 * NULL on success) and keep pool order.
 */
bool partition_word_pool(const crossword_word_t* p_pool, int pool_count, int max_length,
    word_pointer_array_t* pp_usable, int* p_usable_count,
    word_pointer_array_t* pp_omitted, int* p_omitted_count);

/*
 * FUNCTION: select_crossword
 *
 * WHAT:
 * Runs the selection flow for `tier` over `p_pool`.
 *
 * PARAMETERS:
 * - p_pool / pool_count: normalized words. Must outlive the result.
 * - tier               : sets board size and required word count.
 * - p_random           : drives the subset shuffles and the engine.
 * - p_options          : NULL means selection_options_defaults().
 * - p_result           : always initialized; free with selection_result_free.
 *
 * RETURNS:
 * true iff p_result->status == SELECTION_OK.
 */
bool select_crossword(const crossword_word_t* p_pool,
    int pool_count,
    difficulty_tier_t tier,
    random_source_t* p_random,
    const selection_options_t* p_options,
    selection_result_t* p_result);

void selection_result_free(selection_result_t* p_result);

// Short name of a status for logs ("OK", "InsufficientWords", ...).
const char* selection_status_name(selection_status_t status);

#endif
