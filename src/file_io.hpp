#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file read (mmap) and safe whole-file write
 * (write .tmp -> fdatasync -> atomic rename).
 * Errors: throws FileError carrying the errno of the failing call.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, std::string_view data);

bool has_crlf(std::string_view raw);
// Split on "\r\n" or "\n". A final line ending does not produce an extra
// empty line; empty input yields one empty line.
std::vector<std::string> split_lines(std::string_view raw);
