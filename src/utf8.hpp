#pragma once
/*
 * Utf8
 *
 * Purpose: convert between UTF-8 bytes and code points.
 * Note: malformed input decodes to U+FFFD one byte at a time, never throws.
 */
#include <string>
#include <string_view>

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decode the code point starting at text[i] and advance i past it.
char32_t utf8_next(std::string_view text, size_t& i);
std::u32string utf8_decode(std::string_view text);
void utf8_append(std::string& out, char32_t cp);
std::string utf8_encode(std::u32string_view text);
