/*
 * PROJECT: Crossword Layout Generator & Player
 *
 * ARCHITECTURE OVERVIEW:
 * The application builds a crossword from a word-list document and lets a
 * player solve it at the console. The code is split into layers:
 *
 * 1. Data Layer: the Word List Loader reads the document (file or URL),
 *    normalizes every answer / clue and exposes the document metadata.
 * 2. Generation Layer: the Selection Driver samples a subset sized by the
 *    difficulty tier and the Placement Engine lays it out with randomized
 *    backtracking. Both take an injectable random source.
 * 3. Play Layer: the Board View derives numbering and per cell data from the
 *    layout, and Puzzle Score checks the player's letters.
 *
 * USAGE:
 *   crossword_generator <word list path or URL> [tier] [--seed N] [--parallel] [--play]
 *
 *   tier      : basic | intermediate | advanced (Spanish names accepted).
 *               Overrides the document's `level`; default Intermediate.
 *   --seed N  : reproducible run.
 *   --parallel: spread placement restarts over all cores (OpenMP).
 *   --play    : interactive solving after the board is built.
 *
 * EXIT CODES:
 *   0 success, 1 bad usage, 2 word list could not be loaded, 3 no layout.
 */

#include "crossword_types.h"
#include "difficulty_tiers.h"
#include "random_source.h"
#include "placement_engine.h"
#include "selection_driver.h"
#include "word_list.h"
#include "crossword_board.h"
#include "puzzle_score.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>

const int EXIT_USAGE = 1;
const int EXIT_LOAD_FAILED = 2;
const int EXIT_SELECTION_FAILED = 3;
const char* SEPARATOR_TEMPLATE = "------------------------------------------------------------------------------------------";
const int TOTAL_TABLE_WIDTH = 60;

/*
 * STRUCT: command_line_t
 *
 * WHAT:
 * The parsed command line. `tier_name` is NULL when no tier was given.
 */
typedef struct _command_line
{
    const char* source;
    const char* tier_name;
    bool has_seed;
    uint32_t seed;
    bool parallel;
    bool play;
} command_line_t;

static void print_usage(const char* program)
{
    printf("Usage: %s <word list path or URL> [basic|intermediate|advanced] [--seed N] [--parallel] [--play]\n", program);
}

/*
 * FUNCTION: parse_command_line
 *
 * WHAT:
 * Fills `p_cmd` from argv. The first positional argument is the source, the
 * second (optional) is the tier.
 *
 * RETURNS:
 * - false on a missing source, an unknown flag or a bad seed.
 */
static bool parse_command_line(int argc, char* argv[], command_line_t* p_cmd)
{
    memset(p_cmd, 0, sizeof(*p_cmd));

    for (int i = 1; i < argc; i++)
    {
        const char* arg = argv[i];
        if (strcmp(arg, "--seed") == 0)
        {
            if (i + 1 >= argc) { fprintf(stderr, "ERROR: --seed needs a value.\n"); return false; }
            if (!parse_seed_text(argv[++i], &p_cmd->seed)) { fprintf(stderr, "ERROR: Invalid seed '%s' (expected 0 to 4294967295).\n", argv[i]); return false; }
            p_cmd->has_seed = true;
        }
        else if (strcmp(arg, "--parallel") == 0) p_cmd->parallel = true;
        else if (strcmp(arg, "--play") == 0) p_cmd->play = true;
        else if (strncmp(arg, "--", 2) == 0) { fprintf(stderr, "ERROR: Unknown option '%s'.\n", arg); return false; }
        else if (p_cmd->source == NULL) p_cmd->source = arg;
        else if (p_cmd->tier_name == NULL) p_cmd->tier_name = arg;
        else { fprintf(stderr, "ERROR: Unexpected argument '%s'.\n", arg); return false; }
    }

    return p_cmd->source != NULL;
}

/*
 * FUNCTION: resolve_tier
 *
 * WHAT:
 * Command line tier first, then the document's level, then Intermediate.
 */
static difficulty_tier_t resolve_tier(const command_line_t* p_cmd, const word_list_metadata_t* p_meta)
{
    if (p_cmd->tier_name != NULL)
    {
        difficulty_tier_t tier;
        if (!tier_from_name(p_cmd->tier_name, &tier))
        {
            printf("Warning: Unknown tier '%s', using %s.\n", p_cmd->tier_name, get_tier_config(tier)->label);
        }
        return tier;
    }
    if (p_meta->has_level) return p_meta->level;
    return TIER_INTERMEDIATE;
}

static void print_document_info(const word_list_metadata_t* p_meta)
{
    if (p_meta->app_name[0] != '\0') printf("App        : %s\n", p_meta->app_name);
    if (p_meta->description[0] != '\0') printf("Description: %s\n", p_meta->description);
    if (p_meta->author[0] != '\0') printf("Author     : %s\n", p_meta->author);
    if (p_meta->version[0] != '\0') printf("Version    : %s\n", p_meta->version);
    if (p_meta->date[0] != '\0') printf("Date       : %s\n", p_meta->date);
    if (p_meta->platforms[0] != '\0') printf("Platforms  : %s\n", p_meta->platforms);
}

static void print_selection_summary(const selection_result_t* p_result)
{
    const TierConfig* pTier = get_tier_config(p_result->tier);
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
    printf("| Level %-13s Board %2dx%-2d  Words %2d  Points %2d  Time %4ds |\n",
        pTier->label, pTier->rows, pTier->cols, pTier->required_word_count, pTier->points_per_completion, pTier->time_limit_seconds);
    printf("| Usable %3d   Omitted %3d   Selected %3d   Attempts %4d      |\n",
        p_result->usable_count, p_result->omitted_count, p_result->selected_count, p_result->attempts_used);
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
}

/*
 * FUNCTION: run_play_mode
 *
 * WHAT:
 * The interactive solving loop:
 * 1. Shows the empty board and the clues.
 * 2. Reads "<id> <word>" lines (e.g. "A1 CAT"), or 'q' to give up.
 * 3. After every entry re-evaluates the grid and redraws it.
 * 4. Ends when the completion event fires, or on 'q' / end of input, which
 *    is treated like the clock running out.
 */
static void run_play_mode(const crossword_board_t* p_board, difficulty_tier_t tier)
{
    puzzle_score_t score;
    if (!puzzle_score_init(&score, p_board, tier))
    {
        printf("Failed to set up the player grid.\n");
        return;
    }

    printf("\nTime limit for this level: %d seconds.\n", get_tier_config(tier)->time_limit_seconds);
    board_print(p_board, score.p_letters);
    board_print_clues(p_board);

    char buffer[256];
    while (1)
    {
        printf("Enter '<id> <word>' (e.g. 'A1 CAT') or 'q' to give up: ");
        if (fgets(buffer, sizeof(buffer), stdin) == NULL) break;

        char id[CROSSWORD_MAX_ENTRY_ID_LENGTH];
        char word[128];
        if (buffer[0] == 'q' || buffer[0] == 'Q') break;
        if (sscanf(buffer, "%7s %127s", id, word) != 2)
        {
            printf("Please type an entry id and a word, separated by a space.\n");
            continue;
        }

        if (!puzzle_score_fill_entry(&score, id, word))
        {
            printf("'%s' does not fit entry '%s'. Check the id and the letter count.\n", word, id);
            continue;
        }

        puzzle_evaluation_t eval;
        puzzle_score_evaluate(&score, &eval);
        board_print(p_board, score.p_letters);

        if (eval.completion_fired)
        {
            printf(">>> SOLVED! +%d points (total %d) <<<\n", eval.points_won, score.total_points);
            break;
        }
        if (eval.all_filled)
        {
            int wrong = 0;
            for (int r = 0; r < p_board->rows; r++)
                for (int c = 0; c < p_board->cols; c++)
                    if (puzzle_score_cell_status(&score, r, c) == CELL_WRONG) wrong++;
            printf("The grid is full but %d cell(s) are wrong. Keep trying!\n", wrong);
        }
        else
        {
            printf("%d of %d cells filled.\n", eval.filled_cells, eval.letter_cells);
        }
    }

    word_results_t results;
    if (puzzle_score_record_timeout(&score, &results))
    {
        printf("Out of time. Correct words: %d, incorrect words: %d.\n", results.correct_words, results.incorrect_words);
        printf("Solution:\n");
        board_print(p_board, NULL);
    }

    puzzle_score_free(&score);
}

/*
 * FUNCTION: main
 *
 * WHAT:
 * The application entry point.
 * 1. Parses the command line.
 * 2. Loads the word list (file or URL).
 * 3. Resolves the tier and builds the crossword.
 * 4. Prints the board and clues, or starts play mode.
 * 5. Cleans up.
 */
int main(int argc, char* argv[])
{
    printf("Crossword Layout Generator\n");

    command_line_t cmd;
    if (!parse_command_line(argc, argv, &cmd))
    {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // 1. Load the word pool
    word_list_t words;
    word_list_init(&words);
    if (!load_word_list(cmd.source, &words))
    {
        printf("Failed to load word list.\n");
        word_list_free(&words);
        return EXIT_LOAD_FAILED;
    }
    print_document_info(&words.metadata);

    difficulty_tier_t tier = resolve_tier(&cmd, &words.metadata);

    // 2. Random source
    random_source_t random;
    bool haveRandom = cmd.has_seed ? random_source_create_seeded(&random, cmd.seed) : random_source_create_default(&random);
    if (!haveRandom)
    {
        word_list_free(&words);
        return EXIT_SELECTION_FAILED;
    }
    if (cmd.has_seed) printf("Using seed %u.\n", (unsigned)cmd.seed);

    // 3. Build the crossword
    selection_options_t options = selection_options_defaults();
    options.verbose = true;
    options.generator.parallel_restarts = cmd.parallel;

    selection_result_t result;
    int exitCode = 0;
    if (!select_crossword(words.p_words, words.word_count, tier, &random, &options, &result))
    {
        printf("%s\n", result.message);
        exitCode = EXIT_SELECTION_FAILED;
    }
    else
    {
        print_selection_summary(&result);

        crossword_board_t board;
        if (board_build(&result.layout, &board))
        {
            if (cmd.play)
            {
                run_play_mode(&board, tier);
            }
            else
            {
                board_print(&board, NULL);
                board_print_clues(&board);
            }
            board_free(&board);
        }
        else
        {
            printf("Generated layout failed validation.\n");
            exitCode = EXIT_SELECTION_FAILED;
        }
    }

    // 4. Cleanup
    selection_result_free(&result);
    random_source_free(&random);
    word_list_free(&words);
    return exitCode;
}
