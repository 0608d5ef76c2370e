#pragma once
/*
 * UnicodeWidth
 *
 * Purpose: terminal cell width of a code point (0, 1 or 2).
 * Note: locale independent; tabs are not handled here, Row expands them.
 */
#include <cstddef>
#include <string_view>

size_t char_width(char32_t cp);
size_t str_width(std::string_view utf8);
