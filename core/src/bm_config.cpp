/********************************************************************
 * bm_config.cpp  –  loading of the Beider-Morse rule directory.
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
#include "text_utils.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace phonetika {

namespace bm {

static const NameType kNameTypes[] = {NameType::Ashkenazi, NameType::Generic, NameType::Sephardic};
static const RulePhase kPhases[] = {RulePhase::Approx, RulePhase::Exact, RulePhase::Rules};

std::vector<std::string> defaultNamePrefixes(NameType nameType) {
    std::vector<std::string> prefixes;
    switch (nameType) {
        case NameType::Ashkenazi:
            prefixes = {"bar", "ben", "da", "de", "van", "von"};
            break;
        case NameType::Sephardic:
            prefixes = {"al", "el", "da", "dal", "de", "del", "dela", "de la",
                        "della", "des", "di", "do", "dos", "du", "van", "von"};
            break;
        case NameType::Generic:
            prefixes = {"da", "dal", "de", "del", "dela", "de la", "della",
                        "des", "di", "do", "dos", "du", "van", "von"};
            break;
    }
    // Longest first, so "de la" is tried before "de".
    std::sort(prefixes.begin(), prefixes.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() > b.size() : a < b;
    });
    return prefixes;
}

const RuleMap& Repository::ruleMap(NameType nameType, RulePhase phase, const std::string& language) const {
    static const RuleMap empty;
    auto it = rules.find(RuleKey(nameType, phase, language));
    if (it == rules.end()) {
        detail::logger()->trace("No {}_{}_{} rules loaded", toString(nameType), toString(phase), language);
        return empty;
    }
    return it->second;
}

} // namespace bm

// =============================================================================//
// ConfigFiles Implementation (PImpl Idiom)
// =============================================================================//
class ConfigFiles::Impl {
public:
    bm::Repository repository_;
    fs::path dataDir_;

    explicit Impl(const std::string& dataDir) {
        dataDir_ = detail::resolveDataDir(dataDir, "bm");
        if (!fs::is_directory(dataDir_)) {
            throw PhonetikaError(ErrorKind::ParseConfiguration,
                                 "Could not locate rules directory: " + dataDir_.string());
        }

        loadLanguages();
        loadLangs();
        loadRules();

        for (NameType nameType : bm::kNameTypes) {
            repository_.prefixes[nameType] = bm::defaultNamePrefixes(nameType);
        }
    }

    void loadLanguages() {
        for (NameType nameType : bm::kNameTypes) {
            std::string filename = toString(nameType) + "_languages.txt";
            fs::path fullPath = dataDir_ / filename;
            if (!fs::exists(fullPath)) {
                throw PhonetikaError(ErrorKind::UnknownNameType,
                                     "No rules found for NameType " + toString(nameType) + ": missing " + fullPath.string());
            }
            repository_.languages[nameType] =
                bm::parseLanguages(detail::readFileContent(fullPath), filename);
        }
    }

    void loadLangs() {
        for (const auto& entry : repository_.languages) {
            std::string filename = toString(entry.first) + "_lang.txt";
            std::string content = detail::readFileContent(dataDir_ / filename);
            repository_.langs.emplace(entry.first, bm::parseLang(content, filename, entry.second));
        }
    }

    void loadRules() {
        for (const auto& entry : repository_.languages) {
            NameType nameType = entry.first;
            for (bm::RulePhase phase : bm::kPhases) {
                std::string prefix = toString(nameType) + "_" + bm::toString(phase) + "_";
                for (const auto& language : entry.second) {
                    repository_.rules[bm::RuleKey(nameType, phase, language)] =
                        bm::parseRules(dataDir_, prefix + language);
                }
                if (phase != bm::RulePhase::Rules) {
                    repository_.rules[bm::RuleKey(nameType, phase, "common")] =
                        bm::parseRules(dataDir_, prefix + "common");
                }
            }
            detail::logger()->info("Loaded {} rules for {} languages", toString(nameType),
                                   entry.second.size());
        }
    }
};

//  Public ConfigFiles methods forwarding to Impl

ConfigFiles::ConfigFiles(const std::string& dataDir) : pImpl(std::make_unique<Impl>(dataDir)) {}
ConfigFiles::~ConfigFiles() = default;

const bm::Repository& ConfigFiles::repository() const {
    return pImpl->repository_;
}

const std::set<std::string>& ConfigFiles::languages(NameType nameType) const {
    return pImpl->repository_.languages.at(nameType);
}

LanguageSet ConfigFiles::guessLanguages(NameType nameType, const std::string& input) const {
    return pImpl->repository_.langs.at(nameType).guessLanguages(input);
}

const std::vector<std::string>& ConfigFiles::namePrefixes(NameType nameType) const {
    return pImpl->repository_.prefixes.at(nameType);
}

} // namespace phonetika
