#pragma once
/*
 * BufferError
 *
 * Purpose: typed failures raised by the engine's client-facing operations.
 * Kinds: OutOfRange (bad character/row index), FileError (OS failure on
 * open/save), NoFileName (save without an associated path).
 */
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

class BufferError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class OutOfRange : public BufferError {
public:
  OutOfRange() : BufferError("out of range") {}
  explicit OutOfRange(const std::string& what) : BufferError("out of range: " + what) {}
};

class FileError : public BufferError {
public:
  FileError(const std::filesystem::path& path, std::error_code ec);
  const std::filesystem::path& path() const { return path_; }
  std::error_code code() const { return ec_; }
private:
  std::filesystem::path path_;
  std::error_code ec_;
};

class NoFileName : public BufferError {
public:
  NoFileName() : BufferError("no file name for this document") {}
};
