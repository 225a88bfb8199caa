/*
 * FILE: crossword_board.cpp
 *
 * WHAT:
 * Implements the Board View derivation and its console rendering.
 */

#include "crossword_board.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

const char* BOARD_SEPARATOR_TEMPLATE = "----------------------------------------------------------------------------------------------------------------";

// Layout being sorted by board_build; qsort comparators take no context.
static const crossword_layout_t* s_p_sort_layout = NULL;

static int compare_entry_index_by_number(const void* a, const void* b)
{
    int ia = *(const int*)a;
    int ib = *(const int*)b;
    int na = s_p_sort_layout->entries[ia].number;
    int nb = s_p_sort_layout->entries[ib].number;
    if (na != nb) return (na < nb) ? -1 : 1;
    return ia - ib;
}

/*
 * FUNCTION: mark_entry_cells
 *
 * WHAT:
 * Writes one entry's letters into the board, recording which entry covers
 * each cell. Fails on a letter conflict, a second entry of the same
 * direction on a cell, or a letter off the board.
 */
static bool mark_entry_cells(crossword_board_t* p_board, int index)
{
    const crossword_entry_t* pEntry = &p_board->p_layout->entries[index];
    const crossword_word_t* pWord = pEntry->pWord;

    for (int i = 0; i < pWord->answer_length; i++)
    {
        int r, c;
        entry_cell(pEntry->direction, pEntry->row, pEntry->col, i, &r, &c);
        if (r < 0 || r >= p_board->rows || c < 0 || c >= p_board->cols)
        {
            fprintf(stderr, "ERROR: Entry %s leaves the %dx%d board.\n", pEntry->id, p_board->rows, p_board->cols);
            return false;
        }

        board_cell_t* pCell = &p_board->cells[r * p_board->cols + c];
        if (pCell->expected != '\0' && pCell->expected != pWord->answer[i])
        {
            fprintf(stderr, "ERROR: Entry %s conflicts at (%d,%d): '%c' vs '%c'.\n", pEntry->id, r, c, pCell->expected, pWord->answer[i]);
            return false;
        }
        pCell->expected = pWord->answer[i];

        int* pSlot = (pEntry->direction == DIRECTION_ACROSS) ? &pCell->across_entry : &pCell->down_entry;
        if (*pSlot != -1)
        {
            fprintf(stderr, "ERROR: Entry %s overlaps another entry in the same direction at (%d,%d).\n", pEntry->id, r, c);
            return false;
        }
        *pSlot = index;
    }

    board_cell_t* pStart = &p_board->cells[pEntry->row * p_board->cols + pEntry->col];
    pStart->number = pEntry->number;
    return true;
}

bool board_build(const crossword_layout_t* p_layout, crossword_board_t* p_board)
{
    if (p_board == NULL) return false;
    memset(p_board, 0, sizeof(*p_board));
    if (p_layout == NULL || p_layout->rows <= 0 || p_layout->cols <= 0) return false;

    p_board->p_layout = p_layout;
    p_board->rows = p_layout->rows;
    p_board->cols = p_layout->cols;

    int cellCount = p_layout->rows * p_layout->cols;
    size_t entrySlots = (size_t)(p_layout->entry_count > 0 ? p_layout->entry_count : 1);
    p_board->cells = (board_cell_t*)malloc(sizeof(board_cell_t) * cellCount);
    p_board->p_across = (int*)malloc(sizeof(int) * entrySlots);
    p_board->p_down = (int*)malloc(sizeof(int) * entrySlots);
    if (p_board->cells == NULL || p_board->p_across == NULL || p_board->p_down == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory building board view!\n");
        board_free(p_board);
        return false;
    }

    for (int i = 0; i < cellCount; i++)
    {
        p_board->cells[i].expected = '\0';
        p_board->cells[i].number = 0;
        p_board->cells[i].across_entry = -1;
        p_board->cells[i].down_entry = -1;
    }

    // 1. Letters and coverage
    for (int i = 0; i < p_layout->entry_count; i++)
    {
        if (!mark_entry_cells(p_board, i))
        {
            board_free(p_board);
            return false;
        }

        if (p_layout->entries[i].direction == DIRECTION_ACROSS) p_board->p_across[p_board->across_count++] = i;
        else p_board->p_down[p_board->down_count++] = i;
    }

    for (int i = 0; i < cellCount; i++)
    {
        if (p_board->cells[i].expected != '\0') p_board->letter_cell_count++;
    }

    // 2. Clue order
    s_p_sort_layout = p_layout;
    qsort(p_board->p_across, p_board->across_count, sizeof(int), compare_entry_index_by_number);
    qsort(p_board->p_down, p_board->down_count, sizeof(int), compare_entry_index_by_number);
    s_p_sort_layout = NULL;

    return true;
}

void board_free(crossword_board_t* p_board)
{
    if (p_board == NULL) return;
    if (p_board->cells != NULL) free(p_board->cells);
    if (p_board->p_across != NULL) free(p_board->p_across);
    if (p_board->p_down != NULL) free(p_board->p_down);
    p_board->cells = NULL;
    p_board->p_across = NULL;
    p_board->p_down = NULL;
    p_board->across_count = 0;
    p_board->down_count = 0;
    p_board->letter_cell_count = 0;
}

const board_cell_t* board_cell(const crossword_board_t* p_board, int row, int col)
{
    if (row < 0 || row >= p_board->rows || col < 0 || col >= p_board->cols) return NULL;
    return &p_board->cells[row * p_board->cols + col];
}

int board_find_entry(const crossword_board_t* p_board, const char* id)
{
    if (id == NULL) return -1;

    for (int i = 0; i < p_board->p_layout->entry_count; i++)
    {
        const char* a = p_board->p_layout->entries[i].id;
        const char* b = id;
        while (*a != '\0' && toupper((unsigned char)*a) == toupper((unsigned char)*b)) { a++; b++; }
        if (*a == '\0' && *b == '\0') return i;
    }
    return -1;
}

void board_print(const crossword_board_t* p_board, const char* p_letters)
{
    int width = 4 + p_board->cols * 3;

    // Column header
    printf("    ");
    for (int c = 0; c < p_board->cols; c++) printf("%2d ", c);
    printf("\n");
    printf("%.*s\n", width, BOARD_SEPARATOR_TEMPLATE);

    for (int r = 0; r < p_board->rows; r++)
    {
        printf("%2d |", r);
        for (int c = 0; c < p_board->cols; c++)
        {
            const board_cell_t* pCell = &p_board->cells[r * p_board->cols + c];
            char shown;
            if (pCell->expected == '\0') shown = '#';
            else if (p_letters == NULL) shown = pCell->expected;
            else shown = (p_letters[r * p_board->cols + c] != '\0') ? p_letters[r * p_board->cols + c] : '_';

            printf(" %c ", shown);
        }
        printf("\n");
    }
    printf("%.*s\n", width, BOARD_SEPARATOR_TEMPLATE);
}

static void print_clue_section(const crossword_board_t* p_board, const char* title, const int* p_indexes, int count)
{
    printf("%s\n", title);
    for (int i = 0; i < count; i++)
    {
        const crossword_entry_t* pEntry = &p_board->p_layout->entries[p_indexes[i]];
        printf("  %-4s (%d letters, row %d col %d) %s\n",
            pEntry->id, pEntry->pWord->answer_length, pEntry->row, pEntry->col, pEntry->pWord->clue);
    }
}

void board_print_clues(const crossword_board_t* p_board)
{
    print_clue_section(p_board, "ACROSS", p_board->p_across, p_board->across_count);
    print_clue_section(p_board, "DOWN", p_board->p_down, p_board->down_count);
}
