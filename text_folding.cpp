/*
 * FILE: text_folding.cpp
 *
 * WHAT:
 * Implements the accent folding table. All the folded letters live in the
 * Latin-1 supplement, so they are two byte sequences starting with 0xC3.
 */

#include "text_folding.h"
#include <stddef.h>

int fold_spanish_letter(const unsigned char* p, char* p_letter)
{
    if (p == NULL || p[0] != 0xC3 || p[1] == '\0') return 0;

    char letter;
    switch (p[1])
    {
    case 0x81: case 0xA1: letter = 'A'; break;  /* Á á */
    case 0x89: case 0xA9: letter = 'E'; break;  /* É é */
    case 0x8D: case 0xAD: letter = 'I'; break;  /* Í í */
    case 0x93: case 0xB3: letter = 'O'; break;  /* Ó ó */
    case 0x9A: case 0xBA: letter = 'U'; break;  /* Ú ú */
    case 0x9C: case 0xBC: letter = 'U'; break;  /* Ü ü */
    case 0x91: case 0xB1: letter = 'N'; break;  /* Ñ ñ */
    default: return 0;
    }

    *p_letter = letter;
    return 2;
}
