#include "error.hpp"

FileError::FileError(const std::filesystem::path& path, std::error_code ec)
    : BufferError("file error: " + path.string() + ": " + ec.message()),
      path_(path),
      ec_(ec) {}
