#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace utils {

// Replaces characters that are not allowed in file names
std::string sanitizeFilename(const std::string& str, char replacement = '_');

bool boolFromString(const std::string& str);

// Local time formatted as YYYY-mm-ddTHH-MM-SS, safe to use in file names
std::string fileTimestamp();

// Absolute, lexically normalized, without a trailing separator
std::filesystem::path normalizePath(const std::filesystem::path& path);

// Returns path itself if it does not exist, otherwise path with "_N" before
// the extension for the first free N
std::filesystem::path uniqueFilename(const std::filesystem::path& path);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Splits a command line into words, honoring single and double quotes
std::vector<std::string> splitCommandLine(const std::string& line);

} // namespace utils
