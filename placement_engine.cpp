/*
 * FILE: placement_engine.cpp
 *
 * WHAT:
 * Implements the Placement Engine.
 *
 * ARCHITECTURE:
 * 1. Search State: every restart works on one search_state_t (grid, shuffled
 *    order, per word directions, entries placed so far). The grid is mutated
 *    in place and each failed candidate is undone before the next one is tried.
 * 2. Serial Mode: one search state, restarts run one after another.
 * 3. Parallel Mode: OpenMP threads each own a search state and a private
 *    random stream seeded from the caller's source, and draw restart numbers
 *    from a shared counter. The first thread to complete publishes its
 *    entries under a critical section; the others stop drawing.
 * 4. Finalization: the winning entries are copied out and numbered.
 */

#include "placement_engine.h"
#include "crossword_grid.h"
#include <stdio.h>
#include <string.h>
#include <omp.h>

/*
 * STRUCT: candidate_t
 *
 * WHAT:
 * A start cell proposed by a crossing match.
 */
typedef struct _candidate
{
    int row;
    int col;
} candidate_t;

/*
 * STRUCT: search_state_t
 *
 * WHAT:
 * Everything one restart needs. Nothing in here is shared between threads.
 */
typedef struct _search_state
{
    crossword_grid_t grid;
    const crossword_word_t* const* pp_words;    /* Caller's words (input order)      */
    int word_count;
    int* p_order;                               /* Shuffled indexes into pp_words    */
    crossword_entry_t* p_entries;               /* entry i = word at shuffled slot i */
    candidate_t* p_candidates;                  /* One block per recursion depth    */
    int candidate_capacity;                     /* Size of one block                */
    random_source_t* p_random;
} search_state_t;

generator_options_t generator_options_defaults(void)
{
    generator_options_t options;
    options.max_restarts = CROSSWORD_MAX_RESTARTS;
    options.parallel_restarts = false;
    options.verbose = false;
    return options;
}

static direction_t direction_for_slot(int slot)
{
    return (slot % 2 == 0) ? DIRECTION_ACROSS : DIRECTION_DOWN;
}

/*
 * FUNCTION: search_state_init
 *
 * WHAT:
 * Allocates the grid and the per restart buffers. The candidate buffer is
 * sized so every depth has room for the worst case (every occupied cell
 * matching every letter of the longest word).
 */
static bool search_state_init(search_state_t* s, const crossword_word_t* const* pp_words, int word_count, int rows, int cols, int longest, random_source_t* p_random)
{
    memset(s, 0, sizeof(*s));
    s->pp_words = pp_words;
    s->word_count = word_count;
    s->p_random = p_random;
    s->candidate_capacity = rows * cols * longest;

    if (!grid_create(rows, cols, &s->grid)) return false;

    s->p_order = (int*)malloc(sizeof(int) * word_count);
    s->p_entries = (crossword_entry_t*)calloc(word_count, sizeof(crossword_entry_t));
    s->p_candidates = (candidate_t*)malloc(sizeof(candidate_t) * (size_t)s->candidate_capacity * (size_t)word_count);

    if (s->p_order == NULL || s->p_entries == NULL || s->p_candidates == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating placement search state!\n");
        return false;
    }
    return true;
}

static void search_state_free(search_state_t* s)
{
    grid_free(&s->grid);
    if (s->p_order != NULL) free(s->p_order);
    if (s->p_entries != NULL) free(s->p_entries);
    if (s->p_candidates != NULL) free(s->p_candidates);
    s->p_order = NULL;
    s->p_entries = NULL;
    s->p_candidates = NULL;
}

static void record_entry(search_state_t* s, int slot, int row, int col)
{
    crossword_entry_t* pEntry = &s->p_entries[slot];
    pEntry->pWord = s->pp_words[s->p_order[slot]];
    pEntry->direction = direction_for_slot(slot);
    pEntry->row = row;
    pEntry->col = col;
    pEntry->number = 0;
    pEntry->id[0] = '\0';
}

/*
 * FUNCTION: collect_crossing_candidates
 *
 * WHAT:
 * For every occupied cell and every position j of `pWord` holding the same
 * letter, proposes the start cell found by walking j cells back along
 * `direction`. The same start may appear more than once when several letters
 * match; that only means it is retried.
 *
 * RETURNS:
 * The number of candidates written to `p_out`.
 */
static int collect_crossing_candidates(const crossword_grid_t* p_grid, const crossword_word_t* pWord, direction_t direction, candidate_t* p_out)
{
    int count = 0;
    for (int r = 0; r < p_grid->rows; r++)
    {
        for (int c = 0; c < p_grid->cols; c++)
        {
            char cell = p_grid->cells[r * p_grid->cols + c];
            if (cell == '\0') continue;

            for (int j = 0; j < pWord->answer_length; j++)
            {
                if (pWord->answer[j] != cell) continue;

                p_out[count].row = (direction == DIRECTION_ACROSS) ? r : r - j;
                p_out[count].col = (direction == DIRECTION_ACROSS) ? c - j : c;
                count++;
            }
        }
    }
    return count;
}

static void shuffle_candidates(random_source_t* p_random, candidate_t* p_candidates, int count)
{
    for (int i = count - 1; i > 0; i--)
    {
        int j = (int)random_below(p_random, (uint32_t)(i + 1));
        candidate_t tmp = p_candidates[i];
        p_candidates[i] = p_candidates[j];
        p_candidates[j] = tmp;
    }
}

/*
 * FUNCTION: place_remaining_words
 *
 * WHAT:
 * Depth first backtracking over shuffled slots `slot`..word_count-1.
 * A candidate is taken only if it is legal AND covers at least one letter
 * already on the board, which is what keeps the puzzle connected.
 *
 * RETURNS:
 * - true once every slot is filled (the grid and entries hold the solution).
 * - false if no candidate at this depth leads to a full placement. The grid
 *   is then exactly as it was on entry.
 */
static bool place_remaining_words(search_state_t* s, int slot)
{
    if (slot >= s->word_count) return true;

    const crossword_word_t* pWord = s->pp_words[s->p_order[slot]];
    direction_t direction = direction_for_slot(slot);
    candidate_t* pCandidates = s->p_candidates + (size_t)slot * (size_t)s->candidate_capacity;

    int candidate_count = collect_crossing_candidates(&s->grid, pWord, direction, pCandidates);
    if (candidate_count == 0) return false;

    shuffle_candidates(s->p_random, pCandidates, candidate_count);

    bool written[CROSSWORD_MAX_ANSWER_LENGTH];
    for (int i = 0; i < candidate_count; i++)
    {
        int row = pCandidates[i].row;
        int col = pCandidates[i].col;

        if (!grid_can_place(&s->grid, pWord->answer, pWord->answer_length, direction, row, col)) continue;
        if (grid_count_overlaps(&s->grid, pWord->answer_length, direction, row, col) < 1) continue;

        grid_apply_placement(&s->grid, pWord->answer, pWord->answer_length, direction, row, col, written);
        record_entry(s, slot, row, col);

        if (place_remaining_words(s, slot + 1)) return true;

        grid_undo_placement(&s->grid, pWord->answer_length, direction, row, col, written);
    }

    return false;
}

/*
 * FUNCTION: run_single_restart
 *
 * WHAT:
 * One restart: fresh grid, fresh permutation, seed near the centre, then
 * backtracking. The seed takes the first of the 25 centre offsets that is
 * legal; if none is, or if the extension fails, the restart is abandoned.
 */
static bool run_single_restart(search_state_t* s)
{
    static const int offsets[] = { 0, -1, 1, -2, 2 };
    const int offset_count = (int)(sizeof(offsets) / sizeof(offsets[0]));

    grid_clear(&s->grid);

    for (int i = 0; i < s->word_count; i++) s->p_order[i] = i;
    shuffle_int_array(s->p_random, s->p_order, s->word_count);

    const crossword_word_t* pFirst = s->pp_words[s->p_order[0]];
    direction_t firstDirection = direction_for_slot(0);
    int midRow = s->grid.rows / 2;
    int midCol = s->grid.cols / 2;

    int baseRow = (firstDirection == DIRECTION_DOWN) ? midRow - pFirst->answer_length / 2 : midRow;
    int baseCol = (firstDirection == DIRECTION_ACROSS) ? midCol - pFirst->answer_length / 2 : midCol;

    for (int dr = 0; dr < offset_count; dr++)
    {
        for (int dc = 0; dc < offset_count; dc++)
        {
            int row = baseRow + offsets[dr];
            int col = baseCol + offsets[dc];

            if (!grid_can_place(&s->grid, pFirst->answer, pFirst->answer_length, firstDirection, row, col)) continue;

            bool written[CROSSWORD_MAX_ANSWER_LENGTH];
            grid_apply_placement(&s->grid, pFirst->answer, pFirst->answer_length, firstDirection, row, col, written);
            record_entry(s, 0, row, col);

            return place_remaining_words(s, 1);
        }
    }

    return false;
}

/*
 * FUNCTION: build_layout
 *
 * WHAT:
 * Copies the winning entries into a freshly allocated layout and runs the
 * numbering pass.
 */
static bool build_layout(const crossword_entry_t* p_entries, int entry_count, crossword_layout_t* p_layout)
{
    crossword_entry_t* pCopy = (crossword_entry_t*)malloc(sizeof(crossword_entry_t) * entry_count);
    if (pCopy == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating layout entries!\n");
        return false;
    }
    memcpy(pCopy, p_entries, sizeof(crossword_entry_t) * entry_count);

    p_layout->entries = pCopy;
    p_layout->entry_count = entry_count;

    if (!assign_entry_numbers(p_layout))
    {
        crossword_layout_free(p_layout);
        return false;
    }
    return true;
}

/*
 * FUNCTION: validate_generator_input
 *
 * WHAT:
 * Rejects arguments the search cannot work with. Words longer than the long
 * side of the board are the caller's job to filter; they are reported here
 * rather than silently failing 600 restarts.
 */
static bool validate_generator_input(const crossword_word_t* const* pp_words, int word_count, int rows, int cols, random_source_t* p_random, int* p_longest)
{
    if (pp_words == NULL || word_count <= 0)
    {
        fprintf(stderr, "ERROR: generate_crossword called with no words.\n");
        return false;
    }
    if (rows <= 0 || cols <= 0 || rows > CROSSWORD_MAX_BOARD_SIZE || cols > CROSSWORD_MAX_BOARD_SIZE)
    {
        fprintf(stderr, "ERROR: Invalid board size %dx%d (limit %d).\n", rows, cols, CROSSWORD_MAX_BOARD_SIZE);
        return false;
    }
    if (p_random == NULL || p_random->next_u32 == NULL)
    {
        fprintf(stderr, "ERROR: generate_crossword called without a random source.\n");
        return false;
    }

    int maxFit = (rows > cols) ? rows : cols;
    int longest = 0;
    for (int i = 0; i < word_count; i++)
    {
        const crossword_word_t* pWord = pp_words[i];
        if (pWord == NULL || pWord->answer_length <= 0 || pWord->answer_length > maxFit)
        {
            fprintf(stderr, "ERROR: Word %d does not fit a %dx%d board.\n", i, rows, cols);
            return false;
        }
        if (pWord->answer_length > longest) longest = pWord->answer_length;
    }

    *p_longest = longest;
    return true;
}

static bool generate_serial(const crossword_word_t* const* pp_words, int word_count, int rows, int cols, int longest,
    random_source_t* p_random, const generator_options_t* p_options, crossword_layout_t* p_layout)
{
    search_state_t state;
    bool placed = false;
    int restarts_used = 0;

    if (search_state_init(&state, pp_words, word_count, rows, cols, longest, p_random))
    {
        for (int restart = 0; restart < p_options->max_restarts && !placed; restart++)
        {
            restarts_used++;
            placed = run_single_restart(&state);
        }

        if (placed)
        {
            placed = build_layout(state.p_entries, word_count, p_layout);
        }
    }
    search_state_free(&state);

    if (p_options->verbose)
    {
        if (placed) printf("Placed %d words on a %dx%d board after %d restart(s).\n", word_count, rows, cols, restarts_used);
        else printf("Could not place %d words on a %dx%d board in %d restarts.\n", word_count, rows, cols, restarts_used);
    }
    return placed;
}

static bool generate_parallel(const crossword_word_t* const* pp_words, int word_count, int rows, int cols, int longest,
    random_source_t* p_random, const generator_options_t* p_options, crossword_layout_t* p_layout)
{
    // One private random stream per thread, seeded serially from the caller's source.
    int thread_count = omp_get_max_threads();
    uint32_t* pSeeds = (uint32_t*)malloc(sizeof(uint32_t) * thread_count);
    crossword_entry_t* pWinner = (crossword_entry_t*)malloc(sizeof(crossword_entry_t) * word_count);
    if (pSeeds == NULL || pWinner == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory allocating parallel search buffers!\n");
        if (pSeeds) free(pSeeds);
        if (pWinner) free(pWinner);
        return false;
    }
    for (int t = 0; t < thread_count; t++) pSeeds[t] = p_random->next_u32(p_random->p_state);

    int found = 0;
    int next_restart = 0;

    // Restarts are handed out from a shared counter, so a thread that could not
    // set up leaves the whole budget to the others.
#pragma omp parallel num_threads(thread_count)
    {
        random_source_t thread_random;
        search_state_t state;
        memset(&state, 0, sizeof(state));
        bool ready = random_source_create_seeded(&thread_random, pSeeds[omp_get_thread_num()]);
        ready = ready && search_state_init(&state, pp_words, word_count, rows, cols, longest, &thread_random);
        if (!ready)
        {
            fprintf(stderr, "ERROR: Thread %d could not set up its search state; its restarts go to the other threads.\n", omp_get_thread_num());
        }

        while (ready)
        {
            int done;
#pragma omp atomic read
            done = found;
            if (done) break;

            int restart;
#pragma omp atomic capture
            restart = next_restart++;
            if (restart >= p_options->max_restarts) break;

            if (run_single_restart(&state))
            {
#pragma omp critical(crossword_winner)
                {
                    if (!found)
                    {
                        memcpy(pWinner, state.p_entries, sizeof(crossword_entry_t) * word_count);
#pragma omp atomic write
                        found = 1;
                    }
                }
            }
        }

        search_state_free(&state);
        random_source_free(&thread_random);
    }

    int restarts_used = (next_restart < p_options->max_restarts) ? next_restart : p_options->max_restarts;
    bool placed = (found != 0) && build_layout(pWinner, word_count, p_layout);

    if (p_options->verbose)
    {
        if (placed) printf("Placed %d words on a %dx%d board (%d threads, %d restart(s) started).\n", word_count, rows, cols, thread_count, restarts_used);
        else printf("Could not place %d words on a %dx%d board in %d restarts (%d threads).\n", word_count, rows, cols, restarts_used, thread_count);
    }

    free(pSeeds);
    free(pWinner);
    return placed;
}

bool generate_crossword(const crossword_word_t* const* pp_words,
    int word_count,
    int rows,
    int cols,
    random_source_t* p_random,
    const generator_options_t* p_options,
    crossword_layout_t* p_layout)
{
    if (p_layout == NULL) return false;
    p_layout->rows = rows;
    p_layout->cols = cols;
    p_layout->entry_count = 0;
    p_layout->entries = NULL;

    generator_options_t defaults = generator_options_defaults();
    if (p_options == NULL) p_options = &defaults;

    int longest = 0;
    if (!validate_generator_input(pp_words, word_count, rows, cols, p_random, &longest)) return false;

    if (p_options->parallel_restarts)
    {
        return generate_parallel(pp_words, word_count, rows, cols, longest, p_random, p_options, p_layout);
    }
    return generate_serial(pp_words, word_count, rows, cols, longest, p_random, p_options, p_layout);
}

bool assign_entry_numbers(crossword_layout_t* p_layout)
{
    if (p_layout == NULL || p_layout->entry_count == 0) return true;

    int cellCount = p_layout->rows * p_layout->cols;
    int* pNumbers = (int*)calloc(cellCount, sizeof(int));
    if (pNumbers == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory numbering layout!\n");
        return false;
    }

    // 1. Mark every start cell
    for (int i = 0; i < p_layout->entry_count; i++)
    {
        const crossword_entry_t* pEntry = &p_layout->entries[i];
        pNumbers[pEntry->row * p_layout->cols + pEntry->col] = -1;
    }

    // 2. Number them in row-major scan order
    int next = 1;
    for (int cell = 0; cell < cellCount; cell++)
    {
        if (pNumbers[cell] == -1) pNumbers[cell] = next++;
    }

    // 3. Copy the numbers back onto the entries
    for (int i = 0; i < p_layout->entry_count; i++)
    {
        crossword_entry_t* pEntry = &p_layout->entries[i];
        pEntry->number = pNumbers[pEntry->row * p_layout->cols + pEntry->col];
        snprintf(pEntry->id, sizeof(pEntry->id), "%c%d", pEntry->direction == DIRECTION_ACROSS ? 'A' : 'D', pEntry->number);
    }

    free(pNumbers);
    return true;
}

void crossword_layout_free(crossword_layout_t* p_layout)
{
    if (p_layout == NULL) return;
    if (p_layout->entries != NULL) free(p_layout->entries);
    p_layout->entries = NULL;
    p_layout->entry_count = 0;
}
