/*
 * FILE: word_list.cpp
 *
 * WHAT:
 * Implements the word-list ingestion pipeline:
 * 1. Normalization of single answer / clue pairs.
 * 2. Reading the JSON document with nlohmann::json: metadata members and
 *    the word array, Spanish / English key aliases.
 * 3. Sources: a local file read with stdio, or an http(s) URL downloaded with
 *    libcurl into a growing memory buffer.
 *
 * The rest of the application can then assume every word it sees is clean:
 * A-Z answer, non-empty trimmed clue.
 */

#include "word_list.h"
#include "text_folding.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <string>

const int WORD_LIST_INITIAL_CAPACITY = 32;

void word_list_init(word_list_t* p_list)
{
    memset(p_list, 0, sizeof(*p_list));
    p_list->metadata.level = TIER_BASIC;
}

void word_list_free(word_list_t* p_list)
{
    if (p_list == NULL) return;
    if (p_list->p_words != NULL) free(p_list->p_words);
    p_list->p_words = NULL;
    p_list->word_count = 0;
    p_list->capacity = 0;
}

int normalize_answer(const char* raw, char* out, int out_size)
{
    int len = 0;
    const unsigned char* p = (const unsigned char*)raw;

    while (*p != '\0')
    {
        char letter = '\0';

        int consumed = fold_spanish_letter(p, &letter);
        if (consumed > 0)
        {
            p += consumed;
        }
        else
        {
            if (isalpha(*p) && *p < 0x80) letter = (char)toupper(*p);
            p++;
        }

        if (letter == '\0') continue;
        if (len + 1 >= out_size) return -1;
        out[len++] = letter;
    }

    out[len] = '\0';
    return len;
}

void trim_clue(const char* raw, char* out, int out_size)
{
    const char* start = raw;
    while (*start != '\0' && isspace((unsigned char)*start)) start++;

    const char* end = start + strlen(start);
    while (end > start && isspace((unsigned char)*(end - 1))) end--;

    int len = (int)(end - start);
    if (len > out_size - 1) len = out_size - 1;
    memcpy(out, start, len);
    out[len] = '\0';
}

bool make_word(const char* raw_answer, const char* raw_clue, crossword_word_t* p_word)
{
    if (raw_answer == NULL || raw_clue == NULL) return false;

    int length = normalize_answer(raw_answer, p_word->answer, sizeof(p_word->answer));
    if (length <= 0) return false;
    p_word->answer_length = length;

    trim_clue(raw_clue, p_word->clue, sizeof(p_word->clue));
    return p_word->clue[0] != '\0';
}

bool word_list_add(word_list_t* p_list, const char* raw_answer, const char* raw_clue)
{
    crossword_word_t word;
    if (!make_word(raw_answer, raw_clue, &word))
    {
        p_list->discarded_count++;
        return true;
    }

    // Grow by doubling
    if (p_list->word_count == p_list->capacity)
    {
        int newCapacity = (p_list->capacity == 0) ? WORD_LIST_INITIAL_CAPACITY : p_list->capacity * 2;
        crossword_word_t* ptr = (crossword_word_t*)realloc(p_list->p_words, sizeof(crossword_word_t) * newCapacity);
        if (ptr == NULL)
        {
            fprintf(stderr, "ERROR: Out of memory growing word list to %d words!\n", newCapacity);
            return false;
        }
        p_list->p_words = ptr;
        p_list->capacity = newCapacity;
    }

    p_list->p_words[p_list->word_count++] = word;
    return true;
}

// Accepted spellings of each document key, in lookup order.
static const char* const KEYS_WORDS[] = { "palabras", "words", NULL };
static const char* const KEYS_ANSWER[] = { "answer", "palabra", NULL };
static const char* const KEYS_CLUE[] = { "clue", "pista", NULL };
static const char* const KEYS_LEVEL[] = { "nivel", "level", NULL };
static const char* const KEYS_AUTHOR[] = { "autor", "author", NULL };
static const char* const KEYS_VERSION[] = { "version", NULL };
static const char* const KEYS_DATE[] = { "fecha", "date", NULL };
static const char* const KEYS_DESCRIPTION[] = { "descripcion", "description", NULL };
static const char* const KEYS_APP[] = { "nombreApp", "app", NULL };
static const char* const KEYS_PLATFORMS[] = { "plataformas", "platforms", NULL };

/*
 * FUNCTION: find_member
 *
 * WHAT:
 * Returns the first non null member of `object` named by `aliases`, or NULL.
 * With `want_array` set, members that are not arrays are skipped too.
 */
static const nlohmann::json* find_member(const nlohmann::json& object, const char* const* aliases, bool want_array)
{
    for (int i = 0; aliases[i] != NULL; i++)
    {
        nlohmann::json::const_iterator it = object.find(aliases[i]);
        if (it == object.end() || it->is_null()) continue;
        if (want_array && !it->is_array()) continue;
        return &(*it);
    }
    return NULL;
}

/*
 * FUNCTION: member_text
 *
 * WHAT:
 * Copies a scalar member into `out` as text: strings as is, numbers and
 * booleans in their JSON spelling. Missing members, objects and arrays
 * give an empty string.
 */
static void member_text(const nlohmann::json* p_value, char* out, int out_size)
{
    out[0] = '\0';
    if (p_value == NULL) return;

    std::string text;
    if (p_value->is_string()) text = p_value->get<std::string>();
    else if (p_value->is_number() || p_value->is_boolean()) text = p_value->dump();
    else return;

    trim_clue(text.c_str(), out, out_size);
}

/*
 * FUNCTION: join_platforms
 *
 * WHAT:
 * `plataformas` is a list of names; it is kept as one ", " separated line.
 * A plain string is taken as it is.
 */
static void join_platforms(const nlohmann::json* p_value, char* out, int out_size)
{
    out[0] = '\0';
    if (p_value == NULL) return;
    if (!p_value->is_array())
    {
        member_text(p_value, out, out_size);
        return;
    }

    std::string joined;
    for (nlohmann::json::const_iterator it = p_value->begin(); it != p_value->end(); ++it)
    {
        char name[WORD_LIST_META_LENGTH];
        member_text(&(*it), name, sizeof(name));
        if (name[0] == '\0') continue;
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    trim_clue(joined.c_str(), out, out_size);
}

static void read_metadata(const nlohmann::json& document, word_list_metadata_t* p_meta)
{
    char level[WORD_LIST_META_LENGTH];
    member_text(find_member(document, KEYS_LEVEL, false), level, sizeof(level));
    if (level[0] != '\0')
    {
        difficulty_tier_t tier;
        if (!tier_from_name(level, &tier))
        {
            printf("Warning: Unknown level '%s', using %s.\n", level, get_tier_config(tier)->label);
        }
        p_meta->has_level = true;
        p_meta->level = tier;
    }

    member_text(find_member(document, KEYS_AUTHOR, false), p_meta->author, sizeof(p_meta->author));
    member_text(find_member(document, KEYS_VERSION, false), p_meta->version, sizeof(p_meta->version));
    member_text(find_member(document, KEYS_DATE, false), p_meta->date, sizeof(p_meta->date));
    member_text(find_member(document, KEYS_DESCRIPTION, false), p_meta->description, sizeof(p_meta->description));
    member_text(find_member(document, KEYS_APP, false), p_meta->app_name, sizeof(p_meta->app_name));
    join_platforms(find_member(document, KEYS_PLATFORMS, false), p_meta->platforms, sizeof(p_meta->platforms));
}

bool parse_word_list_text(const char* text, word_list_t* p_list)
{
    if (text == NULL || p_list == NULL) return false;

    // 1. Parse without exceptions; a malformed document is a plain failure.
    nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded())
    {
        fprintf(stderr, "ERROR: The word list is not valid JSON.\n");
        return false;
    }
    if (!document.is_object())
    {
        fprintf(stderr, "ERROR: The word list must be a JSON object.\n");
        return false;
    }

    // 2. Metadata
    read_metadata(document, &p_list->metadata);

    // 3. Words
    const nlohmann::json* pWords = find_member(document, KEYS_WORDS, true);
    if (pWords == NULL)
    {
        printf("Warning: No 'palabras' or 'words' array in the word list.\n");
    }
    else
    {
        int index = 0;
        for (nlohmann::json::const_iterator it = pWords->begin(); it != pWords->end(); ++it, ++index)
        {
            if (!it->is_object())
            {
                printf("Warning: Word %d is not an object, skipped.\n", index);
                p_list->discarded_count++;
                continue;
            }

            char answer[CROSSWORD_MAX_CLUE_LENGTH + 1];
            char clue[CROSSWORD_MAX_CLUE_LENGTH + 1];
            member_text(find_member(*it, KEYS_ANSWER, false), answer, sizeof(answer));
            member_text(find_member(*it, KEYS_CLUE, false), clue, sizeof(clue));

            int before = p_list->discarded_count;
            if (!word_list_add(p_list, answer, clue)) return false;
            if (p_list->discarded_count != before)
            {
                printf("Warning: Word %d ('%s') has no usable answer or clue, skipped.\n", index, answer);
            }
        }
    }

    if (p_list->discarded_count > 0)
    {
        printf("Warning: Discarded %d invalid word(s) (empty answer or clue).\n", p_list->discarded_count);
    }
    if (p_list->word_count == 0)
    {
        fprintf(stderr, "ERROR: The word list contains no valid words.\n");
        return false;
    }
    return true;
}

bool load_word_list_file(const char* path, word_list_t* p_list)
{
    FILE* fpIn = fopen(path, "rb");
    if (fpIn == NULL)
    {
        fprintf(stderr, "ERROR: Could not open word list file '%s'!\n", path);
        return false;
    }

    // Read the whole document so the parser sees the same thing as for a download.
    char* pText = NULL;
    size_t size = 0;
    char chunk[4096];
    size_t got;
    while ((got = fread(chunk, 1, sizeof(chunk), fpIn)) > 0)
    {
        char* ptr = (char*)realloc(pText, size + got + 1);
        if (ptr == NULL)
        {
            fprintf(stderr, "ERROR: Out of memory reading '%s'!\n", path);
            free(pText);
            fclose(fpIn);
            return false;
        }
        pText = ptr;
        memcpy(pText + size, chunk, got);
        size += got;
        pText[size] = '\0';
    }

    bool readFailed = ferror(fpIn) != 0;
    fclose(fpIn);

    if (readFailed)
    {
        fprintf(stderr, "ERROR: Failed reading word list file '%s'!\n", path);
        if (pText) free(pText);
        return false;
    }
    if (pText == NULL)
    {
        fprintf(stderr, "ERROR: Word list file '%s' is empty.\n", path);
        return false;
    }

    bool ok = parse_word_list_text(pText, p_list);
    free(pText);

    if (ok) printf("Loaded %d words from '%s'.\n", p_list->word_count, path);
    return ok;
}

/*
 * STRUCT: download_buffer_t
 *
 * WHAT:
 * Accumulates a download. `data` is always null terminated.
 */
typedef struct _download_buffer
{
    char* data;
    size_t size;
} download_buffer_t;

/*
 * FUNCTION: write_callback
 *
 * WHAT:
 * The cURL write callback. Appends each received chunk to the buffer,
 * growing it with realloc. Returning less than `realsize` tells cURL to
 * abort the transfer.
 */
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t realsize = size * nmemb;
    download_buffer_t* pBuffer = (download_buffer_t*)userp;

    char* ptr = (char*)realloc(pBuffer->data, pBuffer->size + realsize + 1);
    if (ptr == NULL) return 0;

    pBuffer->data = ptr;
    memcpy(&(pBuffer->data[pBuffer->size]), contents, realsize);
    pBuffer->size += realsize;
    pBuffer->data[pBuffer->size] = '\0';
    return realsize;
}

/*
 * FUNCTION: download_document
 *
 * WHAT:
 * Performs the blocking GET, following redirects. HTTP error statuses count
 * as failures.
 *
 * RETURNS:
 * The malloc'd body, or NULL.
 */
static char* download_document(const char* url)
{
    download_buffer_t buffer = { NULL, 0 };

    curl_global_init(CURL_GLOBAL_DEFAULT);
    CURL* curl = curl_easy_init();
    if (curl == NULL)
    {
        fprintf(stderr, "ERROR: cURL could not be initialized.\n");
        curl_global_cleanup();
        return NULL;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*)&buffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "crossword_generator/1.0");

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (res != CURLE_OK)
    {
        fprintf(stderr, "ERROR: cURL failed: %s\n", curl_easy_strerror(res));
        if (buffer.data) free(buffer.data);
        buffer.data = NULL;
    }
    else if (status >= 400)
    {
        fprintf(stderr, "ERROR: Server answered HTTP %ld for '%s'.\n", status, url);
        if (buffer.data) free(buffer.data);
        buffer.data = NULL;
    }
    else if (buffer.data == NULL)
    {
        fprintf(stderr, "ERROR: Downloaded word list '%s' is empty.\n", url);
    }

    curl_easy_cleanup(curl);
    curl_global_cleanup();
    return buffer.data;
}

bool load_word_list_url(const char* url, word_list_t* p_list)
{
    printf("Downloading word list from %s ...\n", url);

    char* pText = download_document(url);
    if (pText == NULL) return false;

    bool ok = parse_word_list_text(pText, p_list);
    free(pText);

    if (ok) printf("Loaded %d words from web.\n", p_list->word_count);
    return ok;
}

static bool is_url(const char* source)
{
    return strncmp(source, "http://", 7) == 0 || strncmp(source, "https://", 8) == 0;
}

bool load_word_list(const char* source, word_list_t* p_list)
{
    if (source == NULL || p_list == NULL) return false;
    if (is_url(source)) return load_word_list_url(source, p_list);
    return load_word_list_file(source, p_list);
}
