/********************************************************************
 * text_utils.h  –  shared helpers for text, data files and logging
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <unicode/unistr.h>
#include <spdlog/spdlog.h>

namespace phonetika {
namespace detail {

// ----------------- Logging -----------------
/// The shared "phonetika" logger.
std::shared_ptr<spdlog::logger> logger();

// ----------------- Unicode conversion -----------------
inline icu::UnicodeString toUnicode(const std::string& s) {
    return icu::UnicodeString::fromUTF8(s);
}

inline std::string toUtf8(const icu::UnicodeString& u) {
    std::string out;
    u.toUTF8String(out);
    return out;
}

std::string toLowerEnglish(const std::string& s);

// ----------------- String helpers -----------------
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delimiter);
std::vector<std::string> splitWhitespace(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Keeps the ASCII letters of @p s, upper-cased.
std::string upperAsciiLetters(const std::string& s);

// ----------------- Data files -----------------
/**
 * Resolves the directory holding a family of rule files: @p dataDir when
 * given, otherwise /usr/share/libphonetika/<subdir>/ if it exists, otherwise
 * /usr/local/share/libphonetika/<subdir>/.
 */
std::filesystem::path resolveDataDir(const std::string& dataDir, const std::string& subdir);

/// Reads a whole file. Throws PhonetikaError when it is missing or unreadable.
std::string readFileContent(const std::filesystem::path& fullPath);

/**
 * Walks the lines of a rule resource, skipping blank lines, "//" comments
 * and block comments. A line ending with the block terminator is tested
 * first, so a lone terminator closes the block.
 * @p visit receives the 1-based line number and the trimmed line.
 */
void forEachContentLine(const std::string& content,
                        const std::function<void(int, const std::string&)>& visit);

} // namespace detail
} // namespace phonetika
