/*
 * FILE: puzzle_score.h
 *
 * WHAT:
 * Defines the scoring layer that sits on top of one generated puzzle:
 * 1. The player's letter grid.
 * 2. Per cell status (correct / wrong / empty) once the grid is full.
 * 3. Word results (entries spelled entirely right vs the rest).
 * 4. Two edge triggered events, each firing at most once per puzzle:
 *    - completion: every letter cell correct -> tier points awarded.
 *    - timeout   : the caller reports the clock hit zero while unsolved.
 *
 * A new layout needs a new puzzle_score_t; the fired flags never reset.
 */

#pragma once
#ifndef PUZZLE_SCORE_H
#define PUZZLE_SCORE_H
#include "crossword_types.h"
#include "crossword_board.h"
#include "difficulty_tiers.h"

typedef enum _cell_status
{
    CELL_EMPTY = 0,
    CELL_CORRECT = 1,
    CELL_WRONG = 2
} cell_status_t;

typedef struct _word_results
{
    int correct_words;
    int incorrect_words;
} word_results_t;

/*
 * STRUCT: puzzle_evaluation_t
 *
 * WHAT:
 * What one call to puzzle_score_evaluate saw.
 * - completion_fired: true only on the call that first saw a solved grid.
 * - points_won      : tier points awarded by that call (0 otherwise).
 */
typedef struct _puzzle_evaluation
{
    int filled_cells;
    int letter_cells;
    bool all_filled;
    bool all_correct;
    bool completion_fired;
    int points_won;
} puzzle_evaluation_t;

typedef struct _puzzle_score
{
    const crossword_board_t* p_board;
    difficulty_tier_t tier;
    char* p_letters;             /* rows x cols, '\0' = empty           */
    cell_status_t* p_status;     /* Filled in by puzzle_score_evaluate  */
    bool completion_handled;
    bool timeout_handled;
    int total_points;
} puzzle_score_t;

// Empty player grid for `p_board`. The board must outlive the score.
bool puzzle_score_init(puzzle_score_t* p_score, const crossword_board_t* p_board, difficulty_tier_t tier);

void puzzle_score_free(puzzle_score_t* p_score);

/*
 * FUNCTION: puzzle_score_set_letter
 *
 * WHAT:
 * Writes one letter (case insensitive A-Z) or clears the cell with '\0'.
 *
 * RETURNS:
 * - false for blocked / off board cells and for anything that is not a letter.
 */
bool puzzle_score_set_letter(puzzle_score_t* p_score, int row, int col, char letter);

/*
 * FUNCTION: puzzle_score_fill_entry
 *
 * WHAT:
 * Writes a whole guess into the cells of entry `id` ("A1", "d3"...). The
 * guess is normalized like an answer; crossing cells are overwritten.
 *
 * RETURNS:
 * - false if the id is unknown or the normalized guess has the wrong length.
 *   Nothing is written in that case.
 */
bool puzzle_score_fill_entry(puzzle_score_t* p_score, const char* id, const char* guess);

/*
 * FUNCTION: puzzle_score_evaluate
 *
 * WHAT:
 * Recomputes every cell status. While any letter cell is empty every status
 * is CELL_EMPTY; once all are filled each cell is CELL_CORRECT or CELL_WRONG.
 * The first call that sees every cell correct fires the completion event.
 */
void puzzle_score_evaluate(puzzle_score_t* p_score, puzzle_evaluation_t* p_evaluation);

// Status computed by the last evaluate, CELL_EMPTY for blocked cells.
cell_status_t puzzle_score_cell_status(const puzzle_score_t* p_score, int row, int col);

// Counts entries whose every cell holds the expected letter.
word_results_t puzzle_score_word_results(const puzzle_score_t* p_score);

/*
 * FUNCTION: puzzle_score_record_timeout
 *
 * WHAT:
 * Reports that the time limit was reached.
 *
 * RETURNS:
 * - true (and the word results in *p_results) the first time it is called on
 *   an unsolved puzzle.
 * - false if the timeout already fired, or the puzzle is already solved.
 */
bool puzzle_score_record_timeout(puzzle_score_t* p_score, word_results_t* p_results);

#endif
