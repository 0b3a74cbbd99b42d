#pragma once

#include <string>

namespace gearopt {

// Reads an entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes `contents` to `path`, creating parent directories if needed.
//
// The data goes to a sibling temp file first and is renamed into place, so a
// crash mid-write never leaves a truncated result file behind.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace gearopt
