/*
 * FILE: word_list.h
 *
 * WHAT:
 * Defines the interface for the Word List Loader.
 * This module is responsible for turning a word-list document (a local file
 * or an http(s) URL) into the normalized crossword_word_t pool the generator
 * consumes, plus the document's metadata (level, author, version...).
 *
 * DOCUMENT FORMAT (UTF-8 JSON object):
 *
 *   {
 *     "nivel": "intermedio",                 (alias: level)
 *     "autor": "V. C. Z.",                   (alias: author)
 *     "version": "1.0",
 *     "fecha": "2025-12-02",                 (alias: date)
 *     "descripcion": "...",                  (alias: description)
 *     "nombreApp": "STEAM-G",                (alias: app)
 *     "plataformas": ["Web", "Android"],     (alias: platforms)
 *     "palabras": [                          (alias: words)
 *       { "palabra": "GATO", "pista": "Animal que maulla" },
 *       { "answer": "PERRO", "clue": "Mejor amigo del hombre" }
 *     ]
 *   }
 *
 * Every member is optional except the word array. Inside a word, `answer`
 * wins over `palabra` and `clue` over `pista` when both are present.
 */

#pragma once
#ifndef WORD_LIST_H
#define WORD_LIST_H
#include "crossword_types.h"
#include "difficulty_tiers.h"

const int WORD_LIST_META_LENGTH = 128;

/*
 * STRUCT: word_list_metadata_t
 *
 * WHAT:
 * Optional document fields. Empty strings mean "not given".
 * has_level is false when no level key was present; level then stays Basic.
 */
typedef struct _word_list_metadata
{
    bool has_level;
    difficulty_tier_t level;
    char author[WORD_LIST_META_LENGTH];
    char version[WORD_LIST_META_LENGTH];
    char date[WORD_LIST_META_LENGTH];
    char description[CROSSWORD_MAX_CLUE_LENGTH + 1];
    char app_name[WORD_LIST_META_LENGTH];
    char platforms[WORD_LIST_META_LENGTH];     /* "Web, Android" */
} word_list_metadata_t;

/*
 * STRUCT: word_list_t
 *
 * WHAT:
 * A growable pool of normalized words.
 * - discarded_count: words dropped because answer or clue was empty after
 *   normalization (or the answer was longer than CROSSWORD_MAX_ANSWER_LENGTH).
 */
typedef struct _word_list
{
    crossword_word_t* p_words;
    int word_count;
    int capacity;
    int discarded_count;
    word_list_metadata_t metadata;
} word_list_t;

// Sets every field to empty. Call before the first add or load.
void word_list_init(word_list_t* p_list);

void word_list_free(word_list_t* p_list);

/*
 * FUNCTION: normalize_answer
 *
 * WHAT:
 * Upper cases `raw` and keeps only the letters A-Z. Spanish accented letters
 * (Á É Í Ó Ú Ü Ñ, either case, UTF-8) become their base letter first; every
 * other non letter byte is dropped. "  pi-ña " -> "PINA".
 *
 * RETURNS:
 * The normalized length, or -1 if it would exceed `out_size - 1`.
 */
int normalize_answer(const char* raw, char* out, int out_size);

// Copies `raw` into `out` without leading/trailing whitespace (truncating to out_size-1).
void trim_clue(const char* raw, char* out, int out_size);

/*
 * FUNCTION: make_word
 *
 * WHAT:
 * Builds a normalized word from a raw answer and clue.
 *
 * RETURNS:
 * - false if the answer or the clue is empty after normalization, or the
 *   answer is too long. The word must then be discarded.
 */
bool make_word(const char* raw_answer, const char* raw_clue, crossword_word_t* p_word);

/*
 * FUNCTION: word_list_add
 *
 * WHAT:
 * Normalizes and appends one word. Invalid words are counted in
 * discarded_count and skipped; that is not an error.
 *
 * RETURNS:
 * - false only if the pool could not grow (out of memory).
 */
bool word_list_add(word_list_t* p_list, const char* raw_answer, const char* raw_clue);

/*
 * FUNCTION: parse_word_list_text
 *
 * WHAT:
 * Parses a whole JSON document held in memory, appending words and filling
 * metadata. Words without a usable answer or clue are reported as warnings
 * and counted in discarded_count.
 *
 * RETURNS:
 * - false if the text is not a JSON object, contains no valid words, or
 *   memory ran out.
 */
bool parse_word_list_text(const char* text, word_list_t* p_list);

// Reads a local file and parses it.
bool load_word_list_file(const char* path, word_list_t* p_list);

// Downloads an http:// or https:// document with libcurl and parses it.
bool load_word_list_url(const char* url, word_list_t* p_list);

/*
 * FUNCTION: load_word_list
 *
 * WHAT:
 * The public entry point. URLs go to load_word_list_url, everything else is
 * treated as a file path.
 */
bool load_word_list(const char* source, word_list_t* p_list);

#endif
