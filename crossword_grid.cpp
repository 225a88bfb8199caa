/*
 * FILE: crossword_grid.cpp
 *
 * WHAT:
 * Implements the working letter grid and the placement primitives.
 */

#include "crossword_grid.h"
#include <stdio.h>
#include <string.h>

bool grid_create(int rows, int cols, crossword_grid_t* p_grid)
{
    if (p_grid == NULL) return false;
    p_grid->rows = 0;
    p_grid->cols = 0;
    p_grid->cells = NULL;
    p_grid->axes = NULL;

    if (rows <= 0 || cols <= 0) return false;

    char* cells = (char*)calloc((size_t)rows * (size_t)cols, sizeof(char));
    unsigned char* axes = (unsigned char*)calloc((size_t)rows * (size_t)cols, sizeof(unsigned char));
    if (cells == NULL || axes == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating %dx%d grid!\n", rows, cols);
        if (cells) free(cells);
        if (axes) free(axes);
        return false;
    }

    p_grid->rows = rows;
    p_grid->cols = cols;
    p_grid->cells = cells;
    p_grid->axes = axes;
    return true;
}

void grid_free(crossword_grid_t* p_grid)
{
    if (p_grid == NULL) return;
    if (p_grid->cells != NULL) free(p_grid->cells);
    if (p_grid->axes != NULL) free(p_grid->axes);
    p_grid->cells = NULL;
    p_grid->axes = NULL;
    p_grid->rows = 0;
    p_grid->cols = 0;
}

void grid_clear(crossword_grid_t* p_grid)
{
    memset(p_grid->cells, 0, (size_t)p_grid->rows * (size_t)p_grid->cols);
    memset(p_grid->axes, 0, (size_t)p_grid->rows * (size_t)p_grid->cols);
}

static unsigned char axis_bit(direction_t direction)
{
    return (direction == DIRECTION_ACROSS) ? GRID_AXIS_ACROSS : GRID_AXIS_DOWN;
}

bool grid_in_bounds(const crossword_grid_t* p_grid, int row, int col)
{
    return row >= 0 && row < p_grid->rows && col >= 0 && col < p_grid->cols;
}

char grid_get(const crossword_grid_t* p_grid, int row, int col)
{
    if (!grid_in_bounds(p_grid, row, col)) return '\0';
    return p_grid->cells[row * p_grid->cols + col];
}

bool grid_can_place(const crossword_grid_t* p_grid, const char* answer, int length, direction_t direction, int row, int col)
{
    if (length <= 0) return false;

    // 1. Bounds: the start and the last letter must both be on the board.
    int endRow, endCol;
    entry_cell(direction, row, col, length - 1, &endRow, &endCol);
    if (!grid_in_bounds(p_grid, row, col) || !grid_in_bounds(p_grid, endRow, endCol)) return false;

    // 2. End caps: nothing may touch the word head-on along its own axis.
    int beforeRow, beforeCol, afterRow, afterCol;
    entry_cell(direction, row, col, -1, &beforeRow, &beforeCol);
    entry_cell(direction, row, col, length, &afterRow, &afterCol);
    if (grid_get(p_grid, beforeRow, beforeCol) != '\0') return false;
    if (grid_get(p_grid, afterRow, afterCol) != '\0') return false;

    // 3. Letter by letter
    unsigned char bit = axis_bit(direction);
    for (int i = 0; i < length; i++)
    {
        int r, c;
        entry_cell(direction, row, col, i, &r, &c);
        char existing = grid_get(p_grid, r, c);

        if (existing != '\0')
        {
            if (existing != answer[i]) return false;
            if (p_grid->axes[r * p_grid->cols + c] & bit) return false;
            continue;
        }

        // A new letter must not touch a parallel neighbour.
        if (direction == DIRECTION_ACROSS)
        {
            if (grid_get(p_grid, r - 1, c) != '\0') return false;
            if (grid_get(p_grid, r + 1, c) != '\0') return false;
        }
        else
        {
            if (grid_get(p_grid, r, c - 1) != '\0') return false;
            if (grid_get(p_grid, r, c + 1) != '\0') return false;
        }
    }

    return true;
}

int grid_count_overlaps(const crossword_grid_t* p_grid, int length, direction_t direction, int row, int col)
{
    int overlaps = 0;
    for (int i = 0; i < length; i++)
    {
        int r, c;
        entry_cell(direction, row, col, i, &r, &c);
        if (grid_get(p_grid, r, c) != '\0') overlaps++;
    }
    return overlaps;
}

void grid_apply_placement(crossword_grid_t* p_grid, const char* answer, int length, direction_t direction, int row, int col, bool* p_written)
{
    unsigned char bit = axis_bit(direction);
    for (int i = 0; i < length; i++)
    {
        int r, c;
        entry_cell(direction, row, col, i, &r, &c);
        int index = r * p_grid->cols + c;

        p_written[i] = (p_grid->cells[index] == '\0');
        p_grid->cells[index] = answer[i];
        p_grid->axes[index] |= bit;
    }
}

void grid_undo_placement(crossword_grid_t* p_grid, int length, direction_t direction, int row, int col, const bool* p_written)
{
    unsigned char bit = axis_bit(direction);
    for (int i = 0; i < length; i++)
    {
        int r, c;
        entry_cell(direction, row, col, i, &r, &c);
        int index = r * p_grid->cols + c;

        p_grid->axes[index] &= (unsigned char)~bit;
        if (p_written[i]) p_grid->cells[index] = '\0';
    }
}
