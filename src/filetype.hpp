#pragma once
/*
 * FileType
 *
 * Purpose: human-readable file type label from a file extension, for the
 * status line. Lookup is case-insensitive; the extension has no dot.
 */
#include <string>

// "Unknown" when the extension is not in the table.
std::string filetype_for_extension(const std::string& ext);
