/********************************************************************
 * caverphone.cpp  –  Caverphone 1.0 and 2.0.
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

#include <cctype>

namespace phonetika {

namespace {

const std::string SIX_1 = "111111";
const std::string TEN_1 = "1111111111";

// ----------------- Rewrite helpers -----------------
void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

void replaceStart(std::string& s, const std::string& from, const std::string& to) {
    if (detail::startsWith(s, from)) {
        s.replace(0, from.size(), to);
    }
}

void replaceEnd(std::string& s, const std::string& from, const std::string& to) {
    if (detail::endsWith(s, from)) {
        s.replace(s.size() - from.size(), from.size(), to);
    }
}

bool isVowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

// Lower-cased a-z only.
std::string lowerLetters(const std::string& value) {
    std::string out;
    for (char c : detail::toLowerEnglish(value)) {
        if (c >= 'a' && c <= 'z') {
            out += c;
        }
    }
    return out;
}

// Every run of one of @p letters becomes a single upper-case letter.
void compactRuns(std::string& s, const std::string& letters) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (letters.find(c) == std::string::npos) {
            out += c;
        } else if (i == 0 || s[i - 1] != c) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    s = std::move(out);
}

// Steps shared by both versions, from "cq" up to the vowel marking.
void rewriteConsonantsAndVowels(std::string& txt) {
    replaceAll(txt, "cq", "2q");
    replaceAll(txt, "ci", "si");
    replaceAll(txt, "ce", "se");
    replaceAll(txt, "cy", "sy");
    replaceAll(txt, "tch", "2ch");
    replaceAll(txt, "c", "k");
    replaceAll(txt, "q", "k");
    replaceAll(txt, "x", "k");
    replaceAll(txt, "v", "f");
    replaceAll(txt, "dg", "2g");
    replaceAll(txt, "tio", "sio");
    replaceAll(txt, "tia", "sia");
    replaceAll(txt, "d", "t");
    replaceAll(txt, "ph", "fh");
    replaceAll(txt, "b", "p");
    replaceAll(txt, "sh", "s2");
    replaceAll(txt, "z", "s");
    if (!txt.empty() && isVowel(txt[0])) {
        txt[0] = 'A';
    }
    for (char& c : txt) {
        if (isVowel(c)) {
            c = '3';
        }
    }
}

std::string padTo(std::string txt, const std::string& ones) {
    txt += ones;
    return txt.substr(0, ones.size());
}

} // namespace

// =============================================================================//
// Caverphone 1.0
// =============================================================================//

std::string Caverphone1::encode(const std::string& value) const {
    if (value.empty()) {
        return SIX_1;
    }

    std::string txt = lowerLetters(value);
    replaceStart(txt, "cough", "cou2f");
    replaceStart(txt, "rough", "rou2f");
    replaceStart(txt, "tough", "tou2f");
    replaceStart(txt, "enough", "enou2f");
    replaceStart(txt, "gn", "2n");
    replaceEnd(txt, "mb", "m2");

    rewriteConsonantsAndVowels(txt);

    replaceAll(txt, "3gh3", "3kh3");
    replaceAll(txt, "gh", "22");
    replaceAll(txt, "g", "k");
    compactRuns(txt, "stpkfmn");
    replaceAll(txt, "w3", "W3");
    replaceAll(txt, "wy", "Wy");
    replaceAll(txt, "wh3", "Wh3");
    replaceAll(txt, "why", "Why");
    replaceAll(txt, "w", "2");
    replaceStart(txt, "h", "A");
    replaceAll(txt, "h", "2");
    replaceAll(txt, "r3", "R3");
    replaceAll(txt, "ry", "Ry");
    replaceAll(txt, "r", "2");
    replaceAll(txt, "l3", "L3");
    replaceAll(txt, "ly", "Ly");
    replaceAll(txt, "l", "2");
    replaceAll(txt, "j", "y");
    replaceAll(txt, "y3", "Y3");
    replaceAll(txt, "y", "2");
    replaceAll(txt, "2", "");
    replaceAll(txt, "3", "");

    return padTo(txt, SIX_1);
}

// =============================================================================//
// Caverphone 2.0
// =============================================================================//

std::string Caverphone2::encode(const std::string& value) const {
    if (value.empty()) {
        return TEN_1;
    }

    std::string txt = lowerLetters(value);
    replaceEnd(txt, "e", "");
    replaceStart(txt, "cough", "cou2f");
    replaceStart(txt, "rough", "rou2f");
    replaceStart(txt, "tough", "tou2f");
    replaceStart(txt, "enough", "enou2f");
    replaceStart(txt, "trough", "trou2f");
    replaceStart(txt, "gn", "2n");
    replaceEnd(txt, "mb", "m2");

    rewriteConsonantsAndVowels(txt);

    replaceAll(txt, "j", "y");
    replaceStart(txt, "y3", "Y3");
    replaceStart(txt, "y", "A");
    replaceAll(txt, "y", "3");
    replaceAll(txt, "3gh3", "3kh3");
    replaceAll(txt, "gh", "22");
    replaceAll(txt, "g", "k");
    compactRuns(txt, "stpkfmn");
    replaceAll(txt, "w3", "W3");
    replaceAll(txt, "wh3", "Wh3");
    replaceEnd(txt, "w", "3");
    replaceAll(txt, "w", "2");
    replaceStart(txt, "h", "A");
    replaceAll(txt, "h", "2");
    replaceAll(txt, "r3", "R3");
    replaceEnd(txt, "r", "3");
    replaceAll(txt, "r", "2");
    replaceAll(txt, "l3", "L3");
    replaceEnd(txt, "l", "3");
    replaceAll(txt, "l", "2");
    replaceAll(txt, "2", "");
    replaceEnd(txt, "3", "A");
    replaceAll(txt, "3", "");

    return padTo(txt, TEN_1);
}

} // namespace phonetika
