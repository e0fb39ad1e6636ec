/********************************************************************
 * bm_language_set.cpp  –  name types and the language set lattice.
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
#include "libphonetika/beider_morse.h"
#include "bm_internal.h"

#include <algorithm>
#include <iterator>

namespace phonetika {

// =============================================================================//
// Name and Rule Types
// =============================================================================//

std::string toString(NameType nameType) {
    switch (nameType) {
        case NameType::Ashkenazi: return "ash";
        case NameType::Generic: return "gen";
        case NameType::Sephardic: return "sep";
    }
    return "";
}

std::string toString(RuleType ruleType) {
    switch (ruleType) {
        case RuleType::Approx: return "approx";
        case RuleType::Exact: return "exact";
    }
    return "";
}

NameType parseNameType(const std::string& token) {
    if (token == "ash") return NameType::Ashkenazi;
    if (token == "gen") return NameType::Generic;
    if (token == "sep") return NameType::Sephardic;
    throw PhonetikaError(ErrorKind::UnknownNameType, "Unknown NameType " + token);
}

namespace bm {

std::string toString(RulePhase phase) {
    switch (phase) {
        case RulePhase::Approx: return "approx";
        case RulePhase::Exact: return "exact";
        case RulePhase::Rules: return "rules";
    }
    return "";
}

RulePhase toPhase(RuleType ruleType) {
    switch (ruleType) {
        case RuleType::Approx: return RulePhase::Approx;
        case RuleType::Exact: return RulePhase::Exact;
    }
    return RulePhase::Approx;
}

} // namespace bm

// =============================================================================//
// LanguageSet Implementation
// =============================================================================//

LanguageSet::LanguageSet(Kind kind, std::set<std::string> languages)
    : kind_(kind), languages_(std::move(languages)) {}

LanguageSet LanguageSet::any() {
    return LanguageSet(Kind::Any, {});
}

LanguageSet LanguageSet::noLanguages() {
    return LanguageSet(Kind::NoLanguages, {});
}

LanguageSet LanguageSet::from(std::set<std::string> languages) {
    if (languages.empty()) {
        return noLanguages();
    }
    return LanguageSet(Kind::SomeLanguages, std::move(languages));
}

bool LanguageSet::isEmpty() const {
    return kind_ == Kind::NoLanguages || (kind_ == Kind::SomeLanguages && languages_.empty());
}

bool LanguageSet::isSingleton() const {
    return kind_ == Kind::SomeLanguages && languages_.size() == 1;
}

bool LanguageSet::contains(const std::string& language) const {
    switch (kind_) {
        case Kind::Any: return true;
        case Kind::NoLanguages: return false;
        case Kind::SomeLanguages: return languages_.count(language) > 0;
    }
    return false;
}

std::string LanguageSet::anyLanguage() const {
    if (kind_ != Kind::SomeLanguages || languages_.empty()) {
        return "";
    }
    return *languages_.begin();
}

LanguageSet LanguageSet::restrictTo(const LanguageSet& other) const {
    if (other.kind_ == Kind::Any) return *this;
    if (other.kind_ == Kind::NoLanguages) return other;
    if (kind_ == Kind::SomeLanguages) {
        std::set<std::string> common;
        std::set_intersection(languages_.begin(), languages_.end(),
                              other.languages_.begin(), other.languages_.end(),
                              std::inserter(common, common.begin()));
        return from(std::move(common));
    }
    if (kind_ == Kind::Any) return other;
    return *this;
}

LanguageSet LanguageSet::merge(const LanguageSet& other) const {
    if (other.kind_ == Kind::Any) return other;
    if (other.kind_ == Kind::NoLanguages) return *this;
    if (kind_ == Kind::SomeLanguages) {
        std::set<std::string> all = languages_;
        all.insert(other.languages_.begin(), other.languages_.end());
        return from(std::move(all));
    }
    if (kind_ == Kind::Any) return *this;
    return other;
}

std::string LanguageSet::toString() const {
    switch (kind_) {
        case Kind::Any: return "ANY_LANGUAGE";
        case Kind::NoLanguages: return "NO_LANGUAGES";
        case Kind::SomeLanguages: break;
    }
    std::string result;
    for (const auto& language : languages_) {
        if (!result.empty()) result += ",";
        result += language;
    }
    return result;
}

bool LanguageSet::operator==(const LanguageSet& other) const {
    return kind_ == other.kind_ && languages_ == other.languages_;
}

} // namespace phonetika
