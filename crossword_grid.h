/*
 * FILE: crossword_grid.h
 *
 * WHAT:
 * Defines the working letter grid used during a single generation attempt,
 * and the placement primitives the Placement Engine is built from:
 * 1. Legality check (bounds, end caps, letter agreement, perpendicular neighbours).
 * 2. Overlap counting.
 * 3. Apply / Undo of a placement.
 *
 * The grid is mutated in place. Apply records which cells it newly wrote so
 * that Undo can restore exactly the state before the placement; backtracking
 * siblings therefore always start from the same grid.
 */

#pragma once
#ifndef CROSSWORD_GRID_H
#define CROSSWORD_GRID_H
#include "crossword_types.h"

/*
 * STRUCT: crossword_grid_t
 *
 * WHAT:
 * A rows x cols matrix of letters stored row-major. '\0' marks an empty cell.
 * `axes` holds, per cell, GRID_AXIS_ACROSS / GRID_AXIS_DOWN bits for the
 * directions of the words covering it.
 */
typedef struct _crossword_grid
{
    int rows;
    int cols;
    char* cells;
    unsigned char* axes;
} crossword_grid_t;

const unsigned char GRID_AXIS_ACROSS = 0x01;
const unsigned char GRID_AXIS_DOWN = 0x02;

/*
 * FUNCTION: grid_create
 *
 * WHAT:
 * Allocates an empty grid. Returns false for a non-positive size or when
 * memory cannot be allocated.
 */
bool grid_create(int rows, int cols, crossword_grid_t* p_grid);

void grid_free(crossword_grid_t* p_grid);

// Empties every cell.
void grid_clear(crossword_grid_t* p_grid);

bool grid_in_bounds(const crossword_grid_t* p_grid, int row, int col);

// Letter at (row, col), or '\0' if the cell is empty or out of bounds.
char grid_get(const crossword_grid_t* p_grid, int row, int col);

/*
 * FUNCTION: grid_can_place
 *
 * WHAT:
 * The legality rule for putting `answer` at (row, col) running in `direction`:
 * - All letter cells are inside the grid.
 * - The cell right before the start and right after the end (along the word's
 *   own axis) is empty or off the grid.
 * - An occupied cell must already hold the same letter, and must not already
 *   belong to a word running the same way (no word swallowing another).
 * - An empty cell must have both perpendicular neighbours empty.
 *
 * NOTE:
 * This does NOT require an overlap; callers that need a crossing check
 * grid_count_overlaps separately.
 */
bool grid_can_place(const crossword_grid_t* p_grid, const char* answer, int length, direction_t direction, int row, int col);

// Number of letter cells of the placement that are already occupied.
int grid_count_overlaps(const crossword_grid_t* p_grid, int length, direction_t direction, int row, int col);

/*
 * FUNCTION: grid_apply_placement
 *
 * WHAT:
 * Writes `answer` into the grid. `p_written` (length >= `length`) receives
 * true for every position that was empty before the write, false for
 * positions that were already occupied (crossings).
 *
 * PRECONDITION:
 * grid_can_place returned true for the same arguments.
 */
void grid_apply_placement(crossword_grid_t* p_grid, const char* answer, int length, direction_t direction, int row, int col, bool* p_written);

// Clears the cells flagged in `p_written` by the matching grid_apply_placement call,
// and drops the placement's direction from every cell it covered.
void grid_undo_placement(crossword_grid_t* p_grid, int length, direction_t direction, int row, int col, const bool* p_written);

#endif
