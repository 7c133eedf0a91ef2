#pragma once

#include <string>
#include <vector>

namespace superint {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also looked
// up beneath the source tree and the working directory's ancestors, so tests
// and the CLI can name content files like "data/research/research_tree.json".
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed. The contents
// land in a temporary sibling first and are renamed into place.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

// Returns false if the file did not exist. Throws on other failures.
bool remove_file(const std::string& path);

// Regular files directly inside `dir` whose name ends in `suffix`, sorted.
// Returns an empty list if the directory does not exist.
std::vector<std::string> list_files(const std::string& dir, const std::string& suffix);

} // namespace superint
