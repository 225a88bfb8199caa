/*
 * FILE: difficulty_tiers.cpp
 *
 * WHAT:
 * Implements the tier table and the level name lookup.
 */

#include "difficulty_tiers.h"
#include "text_folding.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

const TierConfig ALL_TIERS[] =
{
    // tier               name            label           rows cols words points time
    { TIER_BASIC,        "basic",        "Basic",          9,   9,   5,    10,   600 },
    { TIER_INTERMEDIATE, "intermediate", "Intermediate",  12,  12,  10,    15,  1200 },
    { TIER_ADVANCED,     "advanced",     "Advanced",      15,  15,  15,    20,  1800 },
};

const int TOTAL_DEFINED_TIERS = sizeof(ALL_TIERS) / sizeof(ALL_TIERS[0]);

/*
 * TABLE: g_tier_aliases
 *
 * WHAT:
 * Every accepted spelling, already folded to lower case ASCII.
 */
typedef struct
{
    const char* alias;
    difficulty_tier_t tier;
} tier_alias_t;

static const tier_alias_t g_tier_aliases[] =
{
    { "basic",        TIER_BASIC },
    { "basico",       TIER_BASIC },
    { "intermediate", TIER_INTERMEDIATE },
    { "intermedio",   TIER_INTERMEDIATE },
    { "advanced",     TIER_ADVANCED },
    { "avanzado",     TIER_ADVANCED },
};

static const int g_tier_alias_count = sizeof(g_tier_aliases) / sizeof(g_tier_aliases[0]);

const TierConfig* get_tier_config(difficulty_tier_t tier)
{
    int index = (int)tier;
    if (index < 0 || index >= TOTAL_DEFINED_TIERS) index = 0;
    return &ALL_TIERS[index];
}

/*
 * FUNCTION: fold_level_name
 *
 * WHAT:
 * Copies `name` into `out` trimmed and lower cased, with accented letters
 * ("básico") reduced to their plain letter.
 */
static void fold_level_name(const char* name, char* out, size_t out_size)
{
    size_t len = 0;
    const unsigned char* p = (const unsigned char*)name;

    while (*p != '\0' && isspace(*p)) p++;

    while (*p != '\0' && len + 1 < out_size)
    {
        char plain;
        int consumed = fold_spanish_letter(p, &plain);
        if (consumed > 0)
        {
            out[len++] = (char)tolower((unsigned char)plain);
            p += consumed;
            continue;
        }
        out[len++] = (char)tolower(*p);
        p++;
    }

    // Trailing whitespace
    while (len > 0 && isspace((unsigned char)out[len - 1])) len--;
    out[len] = '\0';
}

bool tier_from_name(const char* name, difficulty_tier_t* p_tier)
{
    *p_tier = TIER_BASIC;
    if (name == NULL) return false;

    char folded[64];
    fold_level_name(name, folded, sizeof(folded));

    for (int i = 0; i < g_tier_alias_count; i++)
    {
        if (strcmp(folded, g_tier_aliases[i].alias) == 0)
        {
            *p_tier = g_tier_aliases[i].tier;
            return true;
        }
    }
    return false;
}
