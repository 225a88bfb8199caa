/*
 * FILE: puzzle_score.cpp
 *
 * WHAT:
 * Implements the scoring layer: player letters, cell status, word results
 * and the fire-once completion / timeout events.
 */

#include "puzzle_score.h"
#include "word_list.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

bool puzzle_score_init(puzzle_score_t* p_score, const crossword_board_t* p_board, difficulty_tier_t tier)
{
    if (p_score == NULL) return false;
    memset(p_score, 0, sizeof(*p_score));
    if (p_board == NULL || p_board->cells == NULL) return false;

    int cellCount = p_board->rows * p_board->cols;
    p_score->p_board = p_board;
    p_score->tier = tier;
    p_score->p_letters = (char*)calloc(cellCount, sizeof(char));
    p_score->p_status = (cell_status_t*)calloc(cellCount, sizeof(cell_status_t));

    if (p_score->p_letters == NULL || p_score->p_status == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating player grid!\n");
        puzzle_score_free(p_score);
        return false;
    }
    return true;
}

void puzzle_score_free(puzzle_score_t* p_score)
{
    if (p_score == NULL) return;
    if (p_score->p_letters != NULL) free(p_score->p_letters);
    if (p_score->p_status != NULL) free(p_score->p_status);
    p_score->p_letters = NULL;
    p_score->p_status = NULL;
}

bool puzzle_score_set_letter(puzzle_score_t* p_score, int row, int col, char letter)
{
    const board_cell_t* pCell = board_cell(p_score->p_board, row, col);
    if (pCell == NULL || pCell->expected == '\0') return false;

    char stored = '\0';
    if (letter != '\0')
    {
        unsigned char ch = (unsigned char)letter;
        if (ch >= 0x80 || !isalpha(ch)) return false;
        stored = (char)toupper(ch);
    }

    p_score->p_letters[row * p_score->p_board->cols + col] = stored;
    return true;
}

bool puzzle_score_fill_entry(puzzle_score_t* p_score, const char* id, const char* guess)
{
    int index = board_find_entry(p_score->p_board, id);
    if (index < 0 || guess == NULL) return false;

    const crossword_entry_t* pEntry = &p_score->p_board->p_layout->entries[index];
    char normalized[CROSSWORD_MAX_ANSWER_LENGTH + 1];
    int length = normalize_answer(guess, normalized, sizeof(normalized));
    if (length != pEntry->pWord->answer_length) return false;

    for (int i = 0; i < length; i++)
    {
        int r, c;
        entry_cell(pEntry->direction, pEntry->row, pEntry->col, i, &r, &c);
        p_score->p_letters[r * p_score->p_board->cols + c] = normalized[i];
    }
    return true;
}

void puzzle_score_evaluate(puzzle_score_t* p_score, puzzle_evaluation_t* p_evaluation)
{
    const crossword_board_t* pBoard = p_score->p_board;
    int cellCount = pBoard->rows * pBoard->cols;

    puzzle_evaluation_t eval;
    memset(&eval, 0, sizeof(eval));
    eval.letter_cells = pBoard->letter_cell_count;

    // 1. Count what is filled and what is right
    int correct = 0;
    for (int i = 0; i < cellCount; i++)
    {
        char expected = pBoard->cells[i].expected;
        if (expected == '\0') continue;
        if (p_score->p_letters[i] != '\0') eval.filled_cells++;
        if (p_score->p_letters[i] == expected) correct++;
    }
    eval.all_filled = (eval.letter_cells > 0 && eval.filled_cells == eval.letter_cells);
    eval.all_correct = (eval.letter_cells > 0 && correct == eval.letter_cells);

    // 2. Statuses are only shown for a full grid
    for (int i = 0; i < cellCount; i++)
    {
        char expected = pBoard->cells[i].expected;
        if (expected == '\0' || !eval.all_filled) p_score->p_status[i] = CELL_EMPTY;
        else p_score->p_status[i] = (p_score->p_letters[i] == expected) ? CELL_CORRECT : CELL_WRONG;
    }

    // 3. Completion fires once
    if (eval.all_correct && !p_score->completion_handled)
    {
        p_score->completion_handled = true;
        eval.completion_fired = true;
        eval.points_won = get_tier_config(p_score->tier)->points_per_completion;
        p_score->total_points += eval.points_won;
    }

    if (p_evaluation != NULL) *p_evaluation = eval;
}

cell_status_t puzzle_score_cell_status(const puzzle_score_t* p_score, int row, int col)
{
    const board_cell_t* pCell = board_cell(p_score->p_board, row, col);
    if (pCell == NULL || pCell->expected == '\0') return CELL_EMPTY;
    return p_score->p_status[row * p_score->p_board->cols + col];
}

word_results_t puzzle_score_word_results(const puzzle_score_t* p_score)
{
    const crossword_layout_t* pLayout = p_score->p_board->p_layout;
    word_results_t results = { 0, 0 };

    for (int e = 0; e < pLayout->entry_count; e++)
    {
        const crossword_entry_t* pEntry = &pLayout->entries[e];
        bool right = true;
        for (int i = 0; i < pEntry->pWord->answer_length && right; i++)
        {
            int r, c;
            entry_cell(pEntry->direction, pEntry->row, pEntry->col, i, &r, &c);
            right = (p_score->p_letters[r * p_score->p_board->cols + c] == pEntry->pWord->answer[i]);
        }
        if (right) results.correct_words++;
    }

    results.incorrect_words = pLayout->entry_count - results.correct_words;
    return results;
}

bool puzzle_score_record_timeout(puzzle_score_t* p_score, word_results_t* p_results)
{
    if (p_score->timeout_handled || p_score->completion_handled) return false;
    p_score->timeout_handled = true;

    word_results_t results = puzzle_score_word_results(p_score);

    // Solved but never evaluated: nothing to report.
    if (results.incorrect_words == 0 && results.correct_words > 0) return false;

    if (p_results != NULL) *p_results = results;
    return true;
}
