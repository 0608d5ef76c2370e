#pragma once
/*
 * Words
 *
 * Purpose: word-start boundaries of a row for word-jump navigation.
 * Result: ascending character indices, always ending with text.size().
 * Leading tabs (indentation before any text) each count as a boundary.
 */
#include <string_view>
#include <vector>

std::vector<size_t> word_boundaries(std::u32string_view text);
