/*
 * FILE: crossword_board.h
 *
 * WHAT:
 * Defines the Board View: everything a front end needs to draw and play a
 * finished layout, derived once from its entries.
 * 1. Expected letter per cell ('\0' = blocked cell).
 * 2. Clue number per start cell (same row-major numbering as the entry ids).
 * 3. The Across / Down entry passing through every cell.
 * 4. Across and Down entry lists ordered by clue number.
 */

#pragma once
#ifndef CROSSWORD_BOARD_H
#define CROSSWORD_BOARD_H
#include "crossword_types.h"

/*
 * STRUCT: board_cell_t
 *
 * WHAT:
 * - expected    : solution letter, or '\0' for a blocked cell.
 * - number      : clue number if an entry starts here, else 0.
 * - across_entry: index into layout entries of the Across entry covering the
 *                 cell, or -1. Same for down_entry.
 */
typedef struct _board_cell
{
    char expected;
    int number;
    int across_entry;
    int down_entry;
} board_cell_t;

typedef struct _crossword_board
{
    const crossword_layout_t* p_layout;
    int rows;
    int cols;
    board_cell_t* cells;        /* rows x cols, row-major             */
    int letter_cell_count;      /* Cells that are not blocked         */
    int* p_across;              /* Entry indexes ordered by number    */
    int across_count;
    int* p_down;
    int down_count;
} crossword_board_t;

/*
 * FUNCTION: board_build
 *
 * WHAT:
 * Derives the board from `p_layout`. The layout must outlive the board.
 *
 * RETURNS:
 * - false if two entries disagree on a shared cell, an entry leaves the
 *   board, or memory runs out.
 */
bool board_build(const crossword_layout_t* p_layout, crossword_board_t* p_board);

void board_free(crossword_board_t* p_board);

// Cell at (row, col), or NULL off the board.
const board_cell_t* board_cell(const crossword_board_t* p_board, int row, int col);

// Index of the entry whose id matches (case insensitive), or -1.
int board_find_entry(const crossword_board_t* p_board, const char* id);

/*
 * FUNCTION: board_print
 *
 * WHAT:
 * Prints the grid to stdout. `p_letters` (rows x cols, '\0' = empty) shows
 * the player's letters; NULL shows the solution. Blocked cells print as '#'.
 */
void board_print(const crossword_board_t* p_board, const char* p_letters);

// Prints the Across and Down clue lists in number order.
void board_print_clues(const crossword_board_t* p_board);

#endif
