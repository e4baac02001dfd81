// Helpers for reading /proc with an optional root remap (BWMON_PROC_ROOT)
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace bwmon::util {

// Map an absolute /proc path to an alternate root if BWMON_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// Target of a symlink (e.g. /proc/<pid>/exe, /proc/<pid>/fd/<n>). std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// True if every character is an ASCII digit (and s is non-empty).
[[nodiscard]] bool is_number(const std::string& s);

} // namespace bwmon::util
