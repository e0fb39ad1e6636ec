/********************************************************************
 * bm_engine.cpp  –  Beider-Morse phoneme builder and engine.
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
#include <map>

namespace phonetika {

namespace bm {

// =============================================================================//
// PhonemeBuilder Implementation
// =============================================================================//

PhonemeBuilder::PhonemeBuilder(std::set<Phoneme> phonemes) : phonemes_(std::move(phonemes)) {}

PhonemeBuilder PhonemeBuilder::empty(const LanguageSet& languages) {
    return PhonemeBuilder(std::set<Phoneme>{Phoneme("", languages)});
}

void PhonemeBuilder::append(const std::string& text) {
    std::set<Phoneme> next;
    for (const auto& phoneme : phonemes_) {
        next.insert(phoneme.append(text));
    }
    phonemes_ = std::move(next);
}

void PhonemeBuilder::apply(const PhonemeList& alternatives, int maxPhonemes) {
    std::set<Phoneme> next;
    bool full = false;
    for (const auto& left : phonemes_) {
        for (const auto& right : alternatives) {
            LanguageSet languages = left.languages().restrictTo(right.languages());
            if (languages.isEmpty() || static_cast<int>(next.size()) >= maxPhonemes) {
                continue;
            }
            next.insert(Phoneme::join(left, right, std::move(languages)));
            if (static_cast<int>(next.size()) >= maxPhonemes) {
                full = true;
                break;
            }
        }
        if (full) {
            break;
        }
    }
    phonemes_ = std::move(next);
}

std::string PhonemeBuilder::makeString() const {
    std::string result;
    bool first = true;
    for (const auto& phoneme : phonemes_) {
        if (!first) result += "|";
        result += phoneme.text();
        first = false;
    }
    return result;
}

} // namespace bm

// =============================================================================//
// PhoneticEngine Implementation (PImpl Idiom)
// =============================================================================//
class PhoneticEngine::Impl {
public:
    const bm::Repository& repository_;
    const bm::Lang& lang_;
    NameType nameType_;
    RuleType ruleType_;
    bool concat_;
    int maxPhonemes_;

    Impl(const bm::Repository& repository, NameType nameType, RuleType ruleType, bool concat, int maxPhonemes)
        : repository_(repository),
          lang_(repository.langs.at(nameType)),
          nameType_(nameType),
          ruleType_(ruleType),
          concat_(concat),
          maxPhonemes_(maxPhonemes) {}

    std::string encode(const std::string& input) const {
        return encode(input, lang_.guessLanguages(input));
    }

    std::string encode(const std::string& input, const LanguageSet& languages) const;

    bool isNamePrefix(const std::string& word) const {
        const auto& prefixes = repository_.prefixes.at(nameType_);
        return std::find(prefixes.begin(), prefixes.end(), word) != prefixes.end();
    }

    std::vector<std::string> selectWords(const std::vector<std::string>& words) const;
    bool applyRulesAt(const bm::RuleMap& rules, const icu::UnicodeString& input, int32_t& index,
                      bm::PhonemeBuilder& builder) const;
    bm::PhonemeBuilder applyFinalRules(const bm::PhonemeBuilder& builder, const bm::RuleMap& finalRules) const;
};

std::string PhoneticEngine::Impl::encode(const std::string& input, const LanguageSet& languages) const {
    const std::string language = languages.isSingleton() ? languages.anyLanguage() : "any";
    const bm::RuleMap& rules = repository_.ruleMap(nameType_, bm::RulePhase::Rules, language);
    const bm::RuleMap& commonFinalRules = repository_.ruleMap(nameType_, bm::toPhase(ruleType_), "common");
    const bm::RuleMap& languageFinalRules = repository_.ruleMap(nameType_, bm::toPhase(ruleType_), language);

    std::string text = detail::toLowerEnglish(input);
    std::replace(text.begin(), text.end(), '-', ' ');
    text = detail::trim(text);
    detail::logger()->trace("Encoding '{}' as {} ({})", text, language, languages.toString());

    if (nameType_ == NameType::Generic) {
        if (detail::startsWith(text, "d'")) {
            std::string remainder = text.substr(2);
            return "(" + encode(remainder) + ")-(" + encode("d" + remainder) + ")";
        }
        for (const auto& prefix : repository_.prefixes.at(nameType_)) {
            if (detail::startsWith(text, prefix + " ")) {
                std::string remainder = text.substr(prefix.size() + 1);
                return "(" + encode(remainder) + ")-(" + encode(prefix + remainder) + ")";
            }
        }
    }

    std::vector<std::string> words = selectWords(detail::splitWhitespace(text));
    if (concat_) {
        text = detail::join(words, " ");
    } else if (words.size() == 1) {
        text = words.front();
    } else {
        std::vector<std::string> encoded;
        for (const auto& word : words) {
            encoded.push_back(encode(word));
        }
        return detail::join(encoded, "-");
    }

    icu::UnicodeString utext = detail::toUnicode(text);
    bm::PhonemeBuilder builder = bm::PhonemeBuilder::empty(languages);
    for (int32_t i = 0; i < utext.length();) {
        applyRulesAt(rules, utext, i, builder);
    }

    builder = applyFinalRules(builder, commonFinalRules);
    builder = applyFinalRules(builder, languageFinalRules);
    return builder.makeString();
}

std::vector<std::string> PhoneticEngine::Impl::selectWords(const std::vector<std::string>& words) const {
    std::vector<std::string> selected;
    switch (nameType_) {
        case NameType::Sephardic:
            for (const auto& word : words) {
                // "d'angelo" keeps "angelo"; a trailing apostrophe is ignored.
                std::vector<std::string> parts = detail::split(word, '\'');
                while (!parts.empty() && parts.back().empty()) {
                    parts.pop_back();
                }
                if (!parts.empty() && !isNamePrefix(parts.back())) {
                    selected.push_back(parts.back());
                }
            }
            break;
        case NameType::Ashkenazi:
            for (const auto& word : words) {
                if (!isNamePrefix(word)) {
                    selected.push_back(word);
                }
            }
            break;
        case NameType::Generic:
            selected = words;
            break;
    }
    return selected;
}

bool PhoneticEngine::Impl::applyRulesAt(const bm::RuleMap& rules, const icu::UnicodeString& input,
                                        int32_t& index, bm::PhonemeBuilder& builder) const {
    UChar32 c = input.char32At(index);
    int32_t advance = U16_LENGTH(c);
    bool found = false;

    auto bucket = rules.find(c);
    if (bucket != rules.end()) {
        for (const auto& rule : bucket->second) {
            if (rule.patternAndContextMatches(input, index)) {
                builder.apply(rule.phonemes, maxPhonemes_);
                advance = rule.pattern.length();
                found = true;
                break;
            }
        }
    }

    index += advance;
    return found;
}

bm::PhonemeBuilder PhoneticEngine::Impl::applyFinalRules(const bm::PhonemeBuilder& builder,
                                                         const bm::RuleMap& finalRules) const {
    if (finalRules.empty()) {
        return builder;
    }

    std::map<std::string, LanguageSet> merged;
    for (const auto& phoneme : builder.phonemes()) {
        bm::PhonemeBuilder sub = bm::PhonemeBuilder::empty(phoneme.languages());
        icu::UnicodeString text = detail::toUnicode(phoneme.text());
        for (int32_t i = 0; i < text.length();) {
            int32_t start = i;
            if (!applyRulesAt(finalRules, text, i, sub)) {
                sub.append(detail::toUtf8(text.tempSubString(start, i - start)));
            }
        }

        // Equal spellings from different branches pool their languages.
        for (const auto& candidate : sub.phonemes()) {
            auto existing = merged.find(candidate.text());
            if (existing != merged.end()) {
                existing->second = existing->second.merge(candidate.languages());
            } else if (static_cast<int>(merged.size()) < maxPhonemes_) {
                merged.emplace(candidate.text(), candidate.languages());
            }
        }
    }

    std::set<bm::Phoneme> phonemes;
    for (const auto& entry : merged) {
        phonemes.emplace(entry.first, entry.second);
    }
    return bm::PhonemeBuilder(std::move(phonemes));
}

//  Public PhoneticEngine methods forwarding to Impl

PhoneticEngine::PhoneticEngine(const ConfigFiles& config, NameType nameType, RuleType ruleType,
                               bool concat, int maxPhonemes)
    : pImpl(std::make_unique<Impl>(config.repository(), nameType, ruleType, concat, maxPhonemes)) {}

PhoneticEngine::~PhoneticEngine() = default;

std::string PhoneticEngine::encode(const std::string& input) const {
    return pImpl->encode(input);
}

std::string PhoneticEngine::encode(const std::string& input, const LanguageSet& languages) const {
    return pImpl->encode(input, languages);
}

NameType PhoneticEngine::nameType() const { return pImpl->nameType_; }
RuleType PhoneticEngine::ruleType() const { return pImpl->ruleType_; }
bool PhoneticEngine::isConcat() const { return pImpl->concat_; }
int PhoneticEngine::maxPhonemes() const { return pImpl->maxPhonemes_; }

// =============================================================================//
// BeiderMorseEncoder Implementation
// =============================================================================//

BeiderMorseEncoder::BeiderMorseEncoder(const ConfigFiles& config, NameType nameType, RuleType ruleType,
                                       bool concat, int maxPhonemes)
    : engine_(config, nameType, ruleType, concat, maxPhonemes) {}

std::string BeiderMorseEncoder::encode(const std::string& value) const {
    return engine_.encode(value);
}

} // namespace phonetika
