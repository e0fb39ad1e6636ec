/********************************************************************
 * phonetika_core.cpp  –  phonetika core implementation.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include "libphonetika/phonetika_core.h"
#include "text_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <filesystem>

// ICU includes for case mapping
#include <unicode/locid.h>
#include <unicode/uchar.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace phonetika {

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getPhonetikaVersion() {
    // This macro is defined by the CMake build script
    return PHONETIKA_VERSION;
}

void setPhonetikaLogLevel(LogLevel level) {
    auto log = detail::logger();
    switch (level) {
        case LogLevel::Trace: log->set_level(spdlog::level::trace); break;
        case LogLevel::Debug: log->set_level(spdlog::level::debug); break;
        case LogLevel::Info: log->set_level(spdlog::level::info); break;
        case LogLevel::Warn: log->set_level(spdlog::level::warn); break;
        case LogLevel::Error: log->set_level(spdlog::level::err); break;
        case LogLevel::Off: log->set_level(spdlog::level::off); break;
    }
}

PhonetikaError::PhonetikaError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

bool Encoder::isEncodedEquals(const std::string& first, const std::string& second) const {
    return encode(first) == encode(second);
}

int soundexDifference(const Encoder& encoder, const std::string& first, const std::string& second) {
    std::string code1 = encoder.encode(first);
    std::string code2 = encoder.encode(second);
    if (code1.empty() || code2.empty()) {
        return 0;
    }
    int result = 0;
    size_t length = std::min(code1.size(), code2.size());
    for (size_t i = 0; i < length; ++i) {
        if (code1[i] == code2[i]) {
            result++;
        }
    }
    return result;
}

namespace detail {

// ----------------- Logging -----------------
std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("phonetika")) {
            return existing;
        }
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>("phonetika", sink);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::warn);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

// ----------------- Case mapping -----------------
std::string toLowerEnglish(const std::string& s) {
    icu::UnicodeString u = toUnicode(s);
    u.toLower(icu::Locale::getEnglish());
    return toUtf8(u);
}

// ----------------- String helpers -----------------
std::string trim(const std::string& s) {
    const char* whitespace = " \t\n\r\f\v";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string upperAsciiLetters(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

// ----------------- Data files -----------------
fs::path resolveDataDir(const std::string& dataDir, const std::string& subdir) {
    fs::path resolved;
    if (!dataDir.empty()) {
        resolved = dataDir;
    } else if (fs::exists(fs::path("/usr/share/libphonetika") / subdir)) {
        resolved = fs::path("/usr/share/libphonetika") / subdir;
    } else {
        resolved = fs::path("/usr/local/share/libphonetika") / subdir;
    }
    logger()->info("Using {} rules from {}", subdir, resolved.string());
    return resolved;
}

std::string readFileContent(const fs::path& fullPath) {
    if (!fs::exists(fullPath)) {
        throw PhonetikaError(ErrorKind::WrongFilename,
                             "Could not locate critical data file: " + fullPath.string());
    }
    std::ifstream file(fullPath);
    if (!file.is_open()) {
        throw PhonetikaError(ErrorKind::ParseConfiguration,
                             "Could not open critical data file: " + fullPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw PhonetikaError(ErrorKind::ParseConfiguration,
                             "Error reading critical data file: " + fullPath.string());
    }
    return buffer.str();
}

void forEachContentLine(const std::string& content,
                        const std::function<void(int, const std::string&)>& visit) {
    std::istringstream iss(content);
    std::string line;
    int lineNumber = 0;
    bool inBlockComment = false;
    while (std::getline(iss, line)) {
        lineNumber++;
        line = trim(line);

        if (endsWith(line, "*/")) {
            inBlockComment = false;
            continue;
        }
        if (line.empty() || startsWith(line, "//") || inBlockComment) {
            continue;
        }
        if (startsWith(line, "/*")) {
            inBlockComment = true;
            continue;
        }
        visit(lineNumber, line);
    }
}

} // namespace detail
} // namespace phonetika
