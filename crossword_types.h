/*
 * FILE: crossword_types.h
 *
 * WHAT:
 * Defines the core data structures and constants used throughout the application.
 * This includes the Word definition (answer + clue), the Direction enum, the
 * placed Entry record and the finished Crossword Layout, plus the global limits
 * that size the fixed buffers.
 *
 * All layers (Loader, Placement Engine, Selection Driver, Board View, Scoring)
 * include this header and share these exact shapes.
 */

#pragma once
#ifndef CROSSWORD_TYPES_H
#define CROSSWORD_TYPES_H

#include <stdlib.h>
#include <stdbool.h>

/*
 * CONSTANTS: Limits
 *
 * WHAT:
 * Upper bounds for answers, clues and the board.
 * CROSSWORD_MAX_BOARD_SIZE caps one side of the board; the largest tier is 15.
 * CROSSWORD_MAX_ENTRY_ID_LENGTH holds "A" / "D" + up to 4 digits + terminator.
 */
const int CROSSWORD_MAX_ANSWER_LENGTH = 32;
const int CROSSWORD_MAX_CLUE_LENGTH = 255;
const int CROSSWORD_MAX_BOARD_SIZE = 32;
const int CROSSWORD_MAX_ENTRY_ID_LENGTH = 8;

/*
 * CONSTANTS: Search budgets
 *
 * WHAT:
 * CROSSWORD_MAX_RESTARTS: how many fresh permutations the Placement Engine tries.
 * CROSSWORD_MAX_SELECTION_ATTEMPTS: how many random subsets the Selection Driver tries.
 * Worst case for one select() call is the product of the two.
 */
const int CROSSWORD_MAX_RESTARTS = 600;
const int CROSSWORD_MAX_SELECTION_ATTEMPTS = 300;

/*
 * ENUM: direction_t
 *
 * WHAT:
 * The axis a word runs along. Across = left to right, Down = top to bottom.
 */
typedef enum _direction
{
    DIRECTION_ACROSS = 0,
    DIRECTION_DOWN = 1
} direction_t;

/*
 * STRUCT: crossword_word_t
 *
 * WHAT:
 * One answer/clue pair after normalization.
 *
 * FIELD DOMAIN VALUES:
 * - answer: 'A'..'Z' only, length 1..CROSSWORD_MAX_ANSWER_LENGTH, null terminated.
 * - clue  : non-empty, trimmed, null terminated.
 */
typedef struct _crossword_word
{
    char answer[CROSSWORD_MAX_ANSWER_LENGTH + 1];  /* Normalized answer (A-Z)          */
    int answer_length;                             /* strlen(answer), cached            */
    char clue[CROSSWORD_MAX_CLUE_LENGTH + 1];      /* Trimmed clue text                 */
} crossword_word_t;

/*
 * TYPE: word_pointer_array_t
 *
 * WHAT:
 * An array of pointers into a word pool. Used for the selected / usable /
 * omitted views so the bulky word structs are never copied.
 */
typedef const crossword_word_t** word_pointer_array_t;

/*
 * STRUCT: crossword_entry_t
 *
 * WHAT:
 * A word placed on the board. (row, col) is the start cell.
 * `number` and `id` are only filled in by the finalization pass once the
 * whole word set has been placed.
 */
typedef struct _crossword_entry
{
    const crossword_word_t* pWord;               /* Points into the caller's word array */
    direction_t direction;
    int row;
    int col;
    int number;                                  /* Shared clue number (1..n)           */
    char id[CROSSWORD_MAX_ENTRY_ID_LENGTH];      /* "A<n>" or "D<n>"                    */
} crossword_entry_t;

/*
 * STRUCT: crossword_layout_t
 *
 * WHAT:
 * The result of a successful generation. `entries` holds `entry_count` entries
 * in placement order (seed word first). An empty layout (entry_count == 0,
 * entries == NULL) means generation failed.
 *
 * The entries reference the word structs they were generated from, so the word
 * array must outlive the layout.
 */
typedef struct _crossword_layout
{
    int rows;
    int cols;
    int entry_count;
    crossword_entry_t* entries;
} crossword_layout_t;

/*
 * FUNCTION: entry_cell
 *
 * WHAT:
 * Returns the (row, col) of letter `i` of a placement starting at (row, col).
 */
inline void entry_cell(direction_t direction, int row, int col, int i, int* p_row, int* p_col)
{
    *p_row = row + (direction == DIRECTION_DOWN ? i : 0);
    *p_col = col + (direction == DIRECTION_ACROSS ? i : 0);
}

#endif
