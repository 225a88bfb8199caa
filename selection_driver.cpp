/*
 * FILE: selection_driver.cpp
 *
 * WHAT:
 * Implements the Selection Driver: pool filtering, the insufficient words
 * short circuit, and the bounded loop of random subsets fed to the engine.
 */

#include "selection_driver.h"
#include <stdio.h>
#include <string.h>

selection_options_t selection_options_defaults(void)
{
    selection_options_t options;
    options.max_attempts = CROSSWORD_MAX_SELECTION_ATTEMPTS;
    options.generator = generator_options_defaults();
    options.generator_fn = NULL;
    options.verbose = false;
    return options;
}

const char* selection_status_name(selection_status_t status)
{
    switch (status)
    {
    case SELECTION_OK: return "OK";
    case SELECTION_INSUFFICIENT_WORDS: return "InsufficientWords";
    case SELECTION_LAYOUT_NOT_FOUND: return "LayoutNotFound";
    case SELECTION_INVALID_ARGUMENT: return "InvalidArgument";
    }
    return "Unknown";
}

bool partition_word_pool(const crossword_word_t* p_pool, int pool_count, int max_length,
    word_pointer_array_t* pp_usable, int* p_usable_count,
    word_pointer_array_t* pp_omitted, int* p_omitted_count)
{
    if (pool_count < 0 || (pool_count > 0 && p_pool == NULL)) return false;

    // Allocate at least one slot so an empty view is still a valid pointer.
    size_t slots = (size_t)(pool_count > 0 ? pool_count : 1);
    word_pointer_array_t pUsable = (word_pointer_array_t)malloc(sizeof(crossword_word_t*) * slots);
    word_pointer_array_t pOmitted = (word_pointer_array_t)malloc(sizeof(crossword_word_t*) * slots);
    if (pUsable == NULL || pOmitted == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory partitioning word pool!\n");
        if (pUsable) free(pUsable);
        if (pOmitted) free(pOmitted);
        return false;
    }

    int usable = 0;
    int omitted = 0;
    for (int i = 0; i < pool_count; i++)
    {
        if (p_pool[i].answer_length <= max_length) pUsable[usable++] = &p_pool[i];
        else pOmitted[omitted++] = &p_pool[i];
    }

    *pp_usable = pUsable;
    *p_usable_count = usable;
    *pp_omitted = pOmitted;
    *p_omitted_count = omitted;
    return true;
}

static void print_word_view(const char* title, word_pointer_array_t p_view, int count)
{
    printf("%s (%d):", title, count);
    for (int i = 0; i < count; i++)
    {
        printf(" %s", p_view[i]->answer);
    }
    printf("\n");
}

/*
 * FUNCTION: draw_random_subset
 *
 * WHAT:
 * Shuffles the usable indexes and copies the first `count` words into
 * `p_selected`. Uniform over all subsets of that size.
 */
static void draw_random_subset(random_source_t* p_random, word_pointer_array_t p_usable, int usable_count,
    int* p_indexes, word_pointer_array_t p_selected, int count)
{
    for (int i = 0; i < usable_count; i++) p_indexes[i] = i;
    shuffle_int_array(p_random, p_indexes, usable_count);
    for (int i = 0; i < count; i++) p_selected[i] = p_usable[p_indexes[i]];
}

bool select_crossword(const crossword_word_t* p_pool,
    int pool_count,
    difficulty_tier_t tier,
    random_source_t* p_random,
    const selection_options_t* p_options,
    selection_result_t* p_result)
{
    if (p_result == NULL) return false;
    memset(p_result, 0, sizeof(*p_result));

    const TierConfig* pTier = get_tier_config(tier);
    p_result->tier = pTier->tier;
    p_result->required_count = pTier->required_word_count;
    p_result->layout.rows = pTier->rows;
    p_result->layout.cols = pTier->cols;

    selection_options_t defaults = selection_options_defaults();
    if (p_options == NULL) p_options = &defaults;
    crossword_generator_fn generate = (p_options->generator_fn != NULL) ? p_options->generator_fn : generate_crossword;

    if (p_random == NULL || p_random->next_u32 == NULL)
    {
        p_result->status = SELECTION_INVALID_ARGUMENT;
        snprintf(p_result->message, sizeof(p_result->message), "No random source supplied for the %s level.", pTier->label);
        fprintf(stderr, "ERROR: %s\n", p_result->message);
        return false;
    }

    // 1. Partition the pool by what fits the board
    int maxLength = (pTier->rows > pTier->cols) ? pTier->rows : pTier->cols;
    if (!partition_word_pool(p_pool, pool_count, maxLength,
        &p_result->p_usable, &p_result->usable_count,
        &p_result->p_omitted, &p_result->omitted_count))
    {
        p_result->status = SELECTION_INVALID_ARGUMENT;
        snprintf(p_result->message, sizeof(p_result->message), "Could not read the word pool for the %s level.", pTier->label);
        fprintf(stderr, "ERROR: %s\n", p_result->message);
        return false;
    }

    if (p_options->verbose && p_result->omitted_count > 0)
    {
        printf("Warning: %d word(s) omitted for exceeding the %dx%d board.\n", p_result->omitted_count, pTier->rows, pTier->cols);
        print_word_view("Omitted", p_result->p_omitted, p_result->omitted_count);
    }

    // 2. Not enough words: fail without calling the engine
    if (p_result->usable_count < p_result->required_count)
    {
        p_result->status = SELECTION_INSUFFICIENT_WORDS;
        snprintf(p_result->message, sizeof(p_result->message),
            "Not enough words for the %s level (%d required, %d usable).",
            pTier->label, p_result->required_count, p_result->usable_count);
        if (p_options->verbose) printf("%s\n", p_result->message);
        return false;
    }

    // 3. Attempt loop
    int* pIndexes = (int*)malloc(sizeof(int) * p_result->usable_count);
    word_pointer_array_t pSelected = (word_pointer_array_t)malloc(sizeof(crossword_word_t*) * p_result->required_count);
    if (pIndexes == NULL || pSelected == NULL)
    {
        if (pIndexes) free(pIndexes);
        if (pSelected) free(pSelected);
        p_result->status = SELECTION_INVALID_ARGUMENT;
        snprintf(p_result->message, sizeof(p_result->message), "Out of memory selecting words for the %s level.", pTier->label);
        fprintf(stderr, "ERROR: %s\n", p_result->message);
        return false;
    }

    bool built = false;
    for (int attempt = 0; attempt < p_options->max_attempts && !built; attempt++)
    {
        draw_random_subset(p_random, p_result->p_usable, p_result->usable_count, pIndexes, pSelected, p_result->required_count);
        p_result->attempts_used++;

        crossword_layout_t layout = { pTier->rows, pTier->cols, 0, NULL };
        if (generate(pSelected, p_result->required_count, pTier->rows, pTier->cols, p_random, &p_options->generator, &layout)
            && layout.entry_count == p_result->required_count)
        {
            p_result->layout = layout;
            built = true;
        }
        else
        {
            crossword_layout_free(&layout);
        }
    }
    free(pIndexes);

    // 4. Outcome
    if (!built)
    {
        free(pSelected);
        p_result->status = SELECTION_LAYOUT_NOT_FOUND;
        snprintf(p_result->message, sizeof(p_result->message),
            "Could not build a %d-word crossword for the %s level.",
            p_result->required_count, pTier->label);
        if (p_options->verbose) printf("%s (%d attempts)\n", p_result->message, p_result->attempts_used);
        return false;
    }

    p_result->p_selected = pSelected;
    p_result->selected_count = p_result->required_count;
    p_result->status = SELECTION_OK;
    snprintf(p_result->message, sizeof(p_result->message),
        "Built a %d-word crossword for the %s level in %d attempt(s).",
        p_result->required_count, pTier->label, p_result->attempts_used);

    if (p_options->verbose)
    {
        print_word_view("Selected", p_result->p_selected, p_result->selected_count);
        printf("%s\n", p_result->message);
    }
    return true;
}

void selection_result_free(selection_result_t* p_result)
{
    if (p_result == NULL) return;
    crossword_layout_free(&p_result->layout);
    if (p_result->p_selected != NULL) free(p_result->p_selected);
    if (p_result->p_usable != NULL) free(p_result->p_usable);
    if (p_result->p_omitted != NULL) free(p_result->p_omitted);
    p_result->p_selected = NULL;
    p_result->p_usable = NULL;
    p_result->p_omitted = NULL;
    p_result->selected_count = 0;
    p_result->usable_count = 0;
    p_result->omitted_count = 0;
}
