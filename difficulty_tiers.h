/*
 * FILE: difficulty_tiers.h
 *
 * WHAT:
 * Defines the fixed difficulty tier table. A tier pins the board size, how
 * many words a puzzle must hold, the points for completing it and the time
 * limit the play session runs against.
 *
 *   Tier          Board   Words  Points  Time
 *   Basic          9x9      5      10     600s
 *   Intermediate  12x12    10      15    1200s
 *   Advanced      15x15    15      20    1800s
 */

#pragma once
#ifndef DIFFICULTY_TIERS_H
#define DIFFICULTY_TIERS_H

#include <stdbool.h>

typedef enum _difficulty_tier
{
    TIER_BASIC = 0,
    TIER_INTERMEDIATE = 1,
    TIER_ADVANCED = 2
} difficulty_tier_t;

/*
 * STRUCT: TierConfig
 *
 * WHAT:
 * One row of the tier table.
 * - name  : canonical lower case key ("basic").
 * - label : display label used in messages ("Basic").
 * - points_per_completion / time_limit_seconds are only consumed by the
 *   scoring and play layers; the generator never looks at them.
 */
typedef struct
{
    difficulty_tier_t tier;
    const char* name;
    const char* label;
    int rows;
    int cols;
    int required_word_count;
    int points_per_completion;
    int time_limit_seconds;
} TierConfig;

// --- GLOBAL TIER TABLE ---
// Defined in difficulty_tiers.cpp, indexed by difficulty_tier_t.
extern const int TOTAL_DEFINED_TIERS;
extern const TierConfig ALL_TIERS[];

// Row of the table for `tier`. Out of range values yield the Basic row.
const TierConfig* get_tier_config(difficulty_tier_t tier);

/*
 * FUNCTION: tier_from_name
 *
 * WHAT:
 * Maps a level name to a tier. Case insensitive, surrounding whitespace is
 * ignored, and both English and Spanish names are accepted (with or without
 * accents): basic / basico / básico, intermediate / intermedio,
 * advanced / avanzado.
 *
 * RETURNS:
 * - true if the name was recognised.
 * - false otherwise; *p_tier is then set to TIER_BASIC.
 */
bool tier_from_name(const char* name, difficulty_tier_t* p_tier);

#endif
