/*
 * FILE: test_helpers.h
 *
 * WHAT:
 * Shared fixtures for the unit tests: building word pools from plain
 * answers, and a structural checker for generated layouts.
 */

#pragma once
#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H
#include "crossword_types.h"
#include <string>
#include <vector>

// One word per answer, clue "Clue for <ANSWER>".
std::vector<crossword_word_t> make_pool(const std::vector<std::string>& answers);

// Pointer view over every word of `pool`, in pool order.
std::vector<const crossword_word_t*> make_pointer_view(const std::vector<crossword_word_t>& pool);

/*
 * FUNCTION: check_layout
 *
 * WHAT:
 * Verifies a finished layout against the words it was built from:
 * - every word appears exactly once, each entry fits on the board;
 * - crossing letters agree;
 * - every entry after the first shares a cell with an earlier one;
 * - nothing touches an entry head-on, and cells owned by a single entry have
 *   empty perpendicular neighbours;
 * - numbers follow the row-major order of the start cells and the ids are
 *   "A<n>" / "D<n>".
 *
 * RETURNS:
 * An empty string when the layout is sound, otherwise the first problem found.
 */
std::string check_layout(const crossword_layout_t& layout, const crossword_word_t* const* pp_words, int word_count);

// Number of cells covered by both an Across and a Down entry.
int count_crossing_cells(const crossword_layout_t& layout);

#endif
