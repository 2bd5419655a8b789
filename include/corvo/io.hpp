#pragma once
#include <string>

namespace corvo {

/// Entire file contents, byte for byte. Throws FileNotFoundError when the
/// path does not exist and FileAccessError when it cannot be read.
std::string read_text_file(const std::string& path);

/// Create or truncate `path` and write `content`. Throws FileAccessError.
void write_text_file(const std::string& path, const std::string& content);

} // namespace corvo
