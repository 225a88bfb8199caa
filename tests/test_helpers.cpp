/*
 * FILE: test_helpers.cpp
 */

#include "test_helpers.h"
#include "word_list.h"
#include <stdio.h>
#include <string.h>

std::vector<crossword_word_t> make_pool(const std::vector<std::string>& answers)
{
    std::vector<crossword_word_t> pool(answers.size());
    for (size_t i = 0; i < answers.size(); i++)
    {
        std::string clue = "Clue for " + answers[i];
        if (!make_word(answers[i].c_str(), clue.c_str(), &pool[i]))
        {
            fprintf(stderr, "make_pool: rejected answer '%s'\n", answers[i].c_str());
        }
    }
    return pool;
}

std::vector<const crossword_word_t*> make_pointer_view(const std::vector<crossword_word_t>& pool)
{
    std::vector<const crossword_word_t*> view;
    for (size_t i = 0; i < pool.size(); i++) view.push_back(&pool[i]);
    return view;
}

static std::string describe(const crossword_entry_t& entry, const char* problem)
{
    char buffer[160];
    snprintf(buffer, sizeof(buffer), "%s %s at (%d,%d): %s",
        entry.pWord != NULL ? entry.pWord->answer : "(null)",
        entry.direction == DIRECTION_ACROSS ? "across" : "down",
        entry.row, entry.col, problem);
    return buffer;
}

static bool covers(const crossword_entry_t& entry, int row, int col)
{
    for (int i = 0; i < entry.pWord->answer_length; i++)
    {
        int r, c;
        entry_cell(entry.direction, entry.row, entry.col, i, &r, &c);
        if (r == row && c == col) return true;
    }
    return false;
}

std::string check_layout(const crossword_layout_t& layout, const crossword_word_t* const* pp_words, int word_count)
{
    if (layout.entry_count != word_count) return "entry count differs from word count";
    if (layout.entries == NULL) return "no entries";

    int rows = layout.rows;
    int cols = layout.cols;

    // 1. Coverage
    for (int w = 0; w < word_count; w++)
    {
        int seen = 0;
        for (int e = 0; e < layout.entry_count; e++)
        {
            if (layout.entries[e].pWord == pp_words[w]) seen++;
        }
        if (seen != 1) return std::string("word ") + pp_words[w]->answer + " not placed exactly once";
    }

    // Entries come in placement order; slot i runs across when i is even.
    for (int e = 0; e < layout.entry_count; e++)
    {
        direction_t expected = (e % 2 == 0) ? DIRECTION_ACROSS : DIRECTION_DOWN;
        if (layout.entries[e].direction != expected) return describe(layout.entries[e], "direction does not alternate with placement order");
    }

    // 2. Bounds and letter agreement, recording who covers each cell
    std::vector<char> letters(rows * cols, '\0');
    std::vector<int> across(rows * cols, 0);
    std::vector<int> down(rows * cols, 0);
    for (int e = 0; e < layout.entry_count; e++)
    {
        const crossword_entry_t& entry = layout.entries[e];
        for (int i = 0; i < entry.pWord->answer_length; i++)
        {
            int r, c;
            entry_cell(entry.direction, entry.row, entry.col, i, &r, &c);
            if (r < 0 || r >= rows || c < 0 || c >= cols) return describe(entry, "leaves the board");

            char& cell = letters[r * cols + c];
            if (cell != '\0' && cell != entry.pWord->answer[i]) return describe(entry, "letter conflict");
            cell = entry.pWord->answer[i];
            if (entry.direction == DIRECTION_ACROSS) across[r * cols + c]++;
            else down[r * cols + c]++;
        }
    }

    // 3. Connectivity in placement order
    for (int e = 1; e < layout.entry_count; e++)
    {
        const crossword_entry_t& entry = layout.entries[e];
        bool crosses = false;
        for (int i = 0; i < entry.pWord->answer_length && !crosses; i++)
        {
            int r, c;
            entry_cell(entry.direction, entry.row, entry.col, i, &r, &c);
            for (int p = 0; p < e && !crosses; p++) crosses = covers(layout.entries[p], r, c);
        }
        if (!crosses) return describe(entry, "does not cross an earlier entry");
    }

    // 4. Adjacency
    for (int e = 0; e < layout.entry_count; e++)
    {
        const crossword_entry_t& entry = layout.entries[e];
        int br, bc, ar, ac;
        entry_cell(entry.direction, entry.row, entry.col, -1, &br, &bc);
        entry_cell(entry.direction, entry.row, entry.col, entry.pWord->answer_length, &ar, &ac);
        if (br >= 0 && br < rows && bc >= 0 && bc < cols && letters[br * cols + bc] != '\0') return describe(entry, "cell before the start is filled");
        if (ar >= 0 && ar < rows && ac >= 0 && ac < cols && letters[ar * cols + ac] != '\0') return describe(entry, "cell after the end is filled");
    }
    for (int r = 0; r < rows; r++)
    {
        for (int c = 0; c < cols; c++)
        {
            int index = r * cols + c;
            if (across[index] > 1 || down[index] > 1) return "two entries of the same direction share a cell";
            if (letters[index] == '\0' || (across[index] == 1 && down[index] == 1)) continue;

            bool onlyAcross = (across[index] == 1);
            int n1r = onlyAcross ? r - 1 : r, n1c = onlyAcross ? c : c - 1;
            int n2r = onlyAcross ? r + 1 : r, n2c = onlyAcross ? c : c + 1;
            if (n1r >= 0 && n1c >= 0 && letters[n1r * cols + n1c] != '\0') return "parallel entries touch";
            if (n2r < rows && n2c < cols && letters[n2r * cols + n2c] != '\0') return "parallel entries touch";
        }
    }

    // 5. Numbering
    std::vector<int> expected(rows * cols, 0);
    for (int e = 0; e < layout.entry_count; e++)
    {
        expected[layout.entries[e].row * cols + layout.entries[e].col] = -1;
    }
    int next = 1;
    for (int i = 0; i < rows * cols; i++)
    {
        if (expected[i] == -1) expected[i] = next++;
    }
    for (int e = 0; e < layout.entry_count; e++)
    {
        const crossword_entry_t& entry = layout.entries[e];
        int number = expected[entry.row * cols + entry.col];
        if (entry.number != number) return describe(entry, "wrong number");

        char id[CROSSWORD_MAX_ENTRY_ID_LENGTH];
        snprintf(id, sizeof(id), "%c%d", entry.direction == DIRECTION_ACROSS ? 'A' : 'D', number);
        if (strcmp(id, entry.id) != 0) return describe(entry, "wrong id");
    }

    return "";
}

int count_crossing_cells(const crossword_layout_t& layout)
{
    int crossings = 0;
    for (int r = 0; r < layout.rows; r++)
    {
        for (int c = 0; c < layout.cols; c++)
        {
            bool a = false;
            bool d = false;
            for (int e = 0; e < layout.entry_count; e++)
            {
                if (!covers(layout.entries[e], r, c)) continue;
                if (layout.entries[e].direction == DIRECTION_ACROSS) a = true;
                else d = true;
            }
            if (a && d) crossings++;
        }
    }
    return crossings;
}
