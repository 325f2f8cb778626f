#pragma once
#include <string>
#include <vector>

namespace tether {

// Trim whitespace
std::string trim(const std::string& s);

// Split a command line into argv words. Whitespace separates words;
// single and double quotes group, backslash escapes the next character.
std::vector<std::string> split_command(const std::string& line);

// Join words with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Local wall-clock time formatted with strftime
std::string local_time_string(const char* format = "%Y-%m-%d %H:%M:%S");

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace tether
