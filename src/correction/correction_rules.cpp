#include "correction/correction_rules.h"

#include "core/error_codes.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace Correction {

namespace {

// Characters stripped from word edges before matching
constexpr const char* kWordPunctuation = ".,!?;:\"()[]{}";

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool isPunctuation(char c) {
    return c != '\0' && std::strchr(kWordPunctuation, c) != nullptr;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct WordParts {
    std::string leading;
    std::string core;
    std::string trailing;
};

WordParts splitWord(const std::string& word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && isPunctuation(word[begin])) {
        ++begin;
    }
    while (end > begin && isPunctuation(word[end - 1])) {
        --end;
    }
    return {word.substr(0, begin), word.substr(begin, end - begin), word.substr(end)};
}

bool isAllUpper(const std::string& s) {
    bool sawLetter = false;
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            sawLetter = true;
            if (!std::isupper(uc)) {
                return false;
            }
        }
    }
    return sawLetter;
}

// Give `replacement` the capitalization of `original`
std::string matchCase(const std::string& original, const std::string& replacement) {
    if (original.empty() || replacement.empty()) {
        return replacement;
    }
    std::string out = replacement;
    if (original.size() > 1 && isAllUpper(original)) {
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    } else if (std::isupper(static_cast<unsigned char>(original[0]))) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

struct Token {
    std::string text;
    bool isWord;
};

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < text.size()) {
        const bool space = isSpace(text[i]);
        size_t j = i;
        while (j < text.size() && isSpace(text[j]) == space) {
            ++j;
        }
        tokens.push_back({text.substr(i, j - i), !space});
        i = j;
    }
    return tokens;
}

}  // namespace

RuleSet::RuleSet(std::vector<JargonRule> jargon, std::vector<HomophoneRule> homophones)
    : jargon_(std::move(jargon)), homophones_(std::move(homophones)) {
    using DictationEngine::ConfigError;
    using DictationEngine::ErrorCode;

    for (auto& rule : jargon_) {
        if (rule.misheard.empty()) {
            throw ConfigError(ErrorCode::VALIDATION_INVALID_RULES, "jargon key must not be empty");
        }
        rule.misheard = toLower(rule.misheard);
    }
    for (const auto& rule : jargon_) {
        const std::string canonical = toLower(rule.canonical);
        for (const auto& other : jargon_) {
            if (canonical.find(other.misheard) != std::string::npos) {
                throw ConfigError(ErrorCode::VALIDATION_INVALID_RULES,
                                  "canonical form '" + rule.canonical +
                                      "' contains misheard phrase '" + other.misheard + "'");
            }
        }
    }

    for (auto& rule : homophones_) {
        if (rule.word.empty() || rule.replacement.empty()) {
            throw ConfigError(ErrorCode::VALIDATION_INVALID_RULES,
                              "homophone word and replacement must not be empty");
        }
        rule.word = toLower(rule.word);
        for (auto& follower : rule.followers) {
            follower = toLower(follower);
        }
    }
}

RuleSet RuleSet::defaults() {
    std::vector<JargonRule> jargon = {
        {"clod code", "claude code"}, {"cloud code", "claude code"}, {"get hub", "github"},
        {"pie torch", "pytorch"},     {"dock her", "docker"},        {"colonel", "kernel"},
    };

    std::vector<HomophoneRule> homophones = {
        {"too", "to", {"the", "a", "an", "this", "that", "school", "work", "home"}},
        {"your", "you're", {"going", "coming", "looking", "getting", "doing", "working"}},
        {"there", "they're", {"going", "coming", "doing"}},
        {"there", "their", {"house", "car", "phone", "computer", "job"}},
        {"its", "it's", {"going", "time", "ready", "working"}},
    };

    return RuleSet(std::move(jargon), std::move(homophones));
}

std::string RuleSet::applyJargon(const std::string& text,
                                 std::vector<Replacement>& applied) const {
    std::string current = text;
    for (const auto& rule : jargon_) {
        const std::string lower = toLower(current);
        size_t pos = lower.find(rule.misheard);
        if (pos == std::string::npos) {
            continue;
        }

        std::string rebuilt;
        rebuilt.reserve(current.size());
        size_t copied = 0;
        while (pos != std::string::npos) {
            rebuilt.append(current, copied, pos - copied);
            rebuilt.append(rule.canonical);
            applied.emplace_back(current.substr(pos, rule.misheard.size()), rule.canonical);
            copied = pos + rule.misheard.size();
            pos = lower.find(rule.misheard, copied);
        }
        rebuilt.append(current, copied, std::string::npos);
        current = std::move(rebuilt);
    }
    return current;
}

std::string RuleSet::applyHomophones(const std::string& text,
                                     std::vector<Replacement>& applied) const {
    std::vector<Token> tokens = tokenize(text);

    std::vector<size_t> words;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].isWord) {
            words.push_back(i);
        }
    }

    for (size_t w = 0; w + 1 < words.size(); ++w) {
        Token& token = tokens[words[w]];
        const WordParts parts = splitWord(token.text);
        // Trailing punctuation ends the clause; the next word is not context for this one
        if (parts.core.empty() || !parts.trailing.empty()) {
            continue;
        }

        const std::string word = toLower(parts.core);
        const std::string next = toLower(splitWord(tokens[words[w + 1]].text).core);

        for (const auto& rule : homophones_) {
            if (rule.word != word) {
                continue;
            }
            if (std::find(rule.followers.begin(), rule.followers.end(), next) ==
                rule.followers.end()) {
                continue;
            }
            const std::string replaced = matchCase(parts.core, rule.replacement);
            applied.emplace_back(parts.core, replaced);
            token.text = parts.leading + replaced + parts.trailing;
            break;
        }
    }

    std::string out;
    out.reserve(text.size() + 8);
    for (const auto& token : tokens) {
        out += token.text;
    }
    return out;
}

}  // namespace Correction
