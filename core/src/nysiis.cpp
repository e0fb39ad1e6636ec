/********************************************************************
 * nysiis.cpp  –  NYSIIS name coding.
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
#include "libphonetika/encoders.h"
#include "text_utils.h"

#include <initializer_list>

namespace phonetika {

namespace {

const size_t TRUE_LENGTH = 6;

bool isVowel(char c) {
    return c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U';
}

void replaceStart(std::string& s, const std::string& from, const std::string& to) {
    if (detail::startsWith(s, from)) {
        s.replace(0, from.size(), to);
    }
}

bool replaceEnd(std::string& s, const std::string& from, const std::string& to) {
    if (detail::endsWith(s, from)) {
        s.replace(s.size() - from.size(), from.size(), to);
        return true;
    }
    return false;
}

// Replacement for @p current given its neighbours; 0 stands for "no letter".
std::string transcodeRemaining(char previous, char current, char next, char afterNext) {
    if (current == 'E' && next == 'V') {
        return "AF";
    }
    if (isVowel(current)) {
        return "A";
    }

    switch (current) {
        case 'Q': return "G";
        case 'Z': return "S";
        case 'M': return "N";
        case 'K': return next == 'N' ? "NN" : "C";
        default: break;
    }

    if (current == 'S' && next == 'C' && afterNext == 'H') {
        return "SSS";
    }
    if (current == 'P' && next == 'H') {
        return "FF";
    }
    if ((current == 'H' && (!isVowel(previous) || !isVowel(next))) ||
        (current == 'W' && isVowel(previous))) {
        return std::string(1, previous);
    }
    return std::string(1, current);
}

} // namespace

Nysiis::Nysiis(bool strict) : strict_(strict) {}

std::string Nysiis::encode(const std::string& value) const {
    std::string name = detail::upperAsciiLetters(value);
    if (name.empty()) {
        return name;
    }

    // Prefixes
    replaceStart(name, "MAC", "MCC");
    replaceStart(name, "KN", "NN");
    replaceStart(name, "K", "C");
    replaceStart(name, "PH", "FF");
    replaceStart(name, "PF", "FF");
    replaceStart(name, "SCH", "SSS");

    // Suffixes
    if (!replaceEnd(name, "EE", "Y")) {
        replaceEnd(name, "IE", "Y");
    }
    for (const char* suffix : {"DT", "RT", "RD", "NT", "ND"}) {
        if (replaceEnd(name, suffix, "D")) {
            break;
        }
    }

    // Transcoding rewrites the name in place, left to right.
    std::string key(1, name[0]);
    for (size_t i = 1; i < name.size(); ++i) {
        char next = i + 1 < name.size() ? name[i + 1] : '\0';
        char afterNext = i + 2 < name.size() ? name[i + 2] : '\0';
        std::string transcoded = transcodeRemaining(name[i - 1], name[i], next, afterNext);
        name.replace(i, transcoded.size(), transcoded);
        if (name[i] != name[i - 1]) {
            key += name[i];
        }
    }

    if (key.size() > 1) {
        if (key.back() == 'S') {
            key.pop_back();
        }
        if (key.size() > 2 && detail::endsWith(key, "AY")) {
            key.erase(key.size() - 2, 1);
        }
        if (key.back() == 'A') {
            key.pop_back();
        }
    }

    if (strict_ && key.size() > TRUE_LENGTH) {
        key.resize(TRUE_LENGTH);
    }
    return key;
}

} // namespace phonetika
