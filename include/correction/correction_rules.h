#ifndef CORRECTION_RULES_H
#define CORRECTION_RULES_H

#include <string>
#include <utility>
#include <vector>

namespace Correction {

// (original fragment, corrected fragment) as applied to the text
using Replacement = std::pair<std::string, std::string>;

// Case-insensitive literal phrase -> canonical spelling
struct JargonRule {
    std::string misheard;   // Lower-case key
    std::string canonical;  // Replacement text
};

// Replace `word` with `replacement` only when the following word is one of `followers`
struct HomophoneRule {
    std::string word;
    std::string replacement;
    std::vector<std::string> followers;
};

// Immutable rule tables for the two correction passes.
//
// Jargon rules run first, in table order. Homophone rules are checked in table order per
// word and the first rule whose follower set matches wins.
class RuleSet {
   public:
    // Throws DictationEngine::ConfigError when a key is empty or a canonical form contains
    // a misheard key (a second pass would change already-corrected text).
    RuleSet(std::vector<JargonRule> jargon, std::vector<HomophoneRule> homophones);

    // Built-in technical vocabulary and the common dictation homophones
    static RuleSet defaults();

    // Replace every case-insensitive occurrence of each misheard phrase.
    // Appends one Replacement per occurrence.
    std::string applyJargon(const std::string& text, std::vector<Replacement>& applied) const;

    // Word-by-word context check. Whitespace and surrounding punctuation are preserved and
    // the replacement follows the capitalization of the word it replaces.
    std::string applyHomophones(const std::string& text,
                                std::vector<Replacement>& applied) const;

    const std::vector<JargonRule>& jargon() const {
        return jargon_;
    }
    const std::vector<HomophoneRule>& homophones() const {
        return homophones_;
    }

   private:
    std::vector<JargonRule> jargon_;
    std::vector<HomophoneRule> homophones_;
};

}  // namespace Correction

#endif  // CORRECTION_RULES_H
