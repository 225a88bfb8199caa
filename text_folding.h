/*
 * FILE: text_folding.h
 *
 * WHAT:
 * Folding of the UTF-8 Spanish letters used in answers and level names
 * (Á É Í Ó Ú Ü Ñ, either case) onto their plain ASCII base letter.
 * Shared by the Word List Loader and the Difficulty Tiers name lookup.
 */

#pragma once
#ifndef TEXT_FOLDING_H
#define TEXT_FOLDING_H

/*
 * FUNCTION: fold_spanish_letter
 *
 * WHAT:
 * Looks at the UTF-8 sequence starting at `p`. If it is one of the folded
 * letters, stores the upper case base letter in *p_letter.
 *
 * RETURNS:
 * - The number of bytes consumed (2), or 0 if `p` does not start a folded letter.
 */
int fold_spanish_letter(const unsigned char* p, char* p_letter);

#endif
