#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace utils {

std::string sanitizeFilename(const std::string& str, char replacement) {
    static const std::string banned = "/<>:\"\\|?*";

    auto first = str.find_first_not_of(" \t\r\n");
    auto last = str.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }

    std::string result = str.substr(first, last - first + 1);
    for (auto& c : result) {
        if (banned.find(c) != std::string::npos) {
            c = replacement;
        }
    }
    return result;
}

bool boolFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "y" || lower == "yes" || lower == "true" || lower == "1";
}

std::string fileTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
    localtime_r(&now, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%dT%H-%M-%S");
    return ss.str();
}

std::filesystem::path normalizePath(const std::filesystem::path& path) {
    auto normalized = std::filesystem::absolute(path).lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename
    if (!normalized.has_filename() && normalized.has_parent_path() &&
        normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

std::filesystem::path uniqueFilename(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return path;
    }

    const auto stem = path.stem().string();
    const auto ext = path.extension().string();
    const auto dir = path.parent_path();
    for (int inc = 0;; ++inc) {
        auto candidate = dir / (stem + "_" + std::to_string(inc) + ext);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::vector<std::string> splitCommandLine(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }

    if (quote != '\0') {
        throw std::invalid_argument("Unterminated quote in: " + line);
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

} // namespace utils
