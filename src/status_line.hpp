#pragma once
/*
 * StatusLine
 *
 * Purpose: text layout helpers for status bars drawn by a client.
 */
#include <optional>
#include <string>
#include <string_view>

// lhs + padding + rhs with a total display width of exactly `width`
// (tabs count as tab_width). nullopt when lhs and rhs do not fit.
std::optional<std::string> align_sides(const std::string& lhs, const std::string& rhs,
                                       size_t width, size_t tab_width);

// Longest prefix of already-expanded UTF-8 text that fits in `width`
// display cells; a wide character that would straddle the edge is dropped.
std::string clip_to_width(std::string_view text, size_t width);
