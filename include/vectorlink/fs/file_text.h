#pragma once

#include <string>
#include <string_view>

#include "vectorlink/fs/filesystem.h"

namespace vectorlink::fs {

// Path helpers for the POSIX-style paths used by IFileSystem.
std::string parent_path(std::string_view path);
std::string join_path(std::string_view dir, std::string_view name);

// Reads a whole file as text. Returns false if it cannot be opened.
bool read_text_file(IFileSystem& fs, const std::string& path, std::string& out);

// Creates/truncates a file and writes text to it. Returns false on open
// failure or short write.
bool write_text_file(IFileSystem& fs, const std::string& path, std::string_view text);

// mkdir -p: creates every missing level of `path`.
bool create_directories(IFileSystem& fs, const std::string& path);

} // namespace vectorlink::fs
