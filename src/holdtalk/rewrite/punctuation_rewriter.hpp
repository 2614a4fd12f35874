#pragma once

#include "error.hpp"

#include <string>
#include <string_view>
#include <vector>

// A spoken command. Saying any trigger yields the symbol; saying an escape
// ("actual new line") yields the literal words instead.
struct CommandRule {
    std::vector<std::string> triggers; // lower case, first one is the literal form
    std::vector<std::string> escapes;  // each contains one of the triggers
    std::string symbol;

    const std::string& literal() const { return triggers.front(); }
};

// Builds a rule whose escapes are "actual " + each trigger.
CommandRule make_rule(std::vector<std::string> triggers, std::string symbol);

// new line, inverted comma, comma, full stop.
const std::vector<CommandRule>& default_rules();

// Rewrites command phrases in a transcript. Matching is ASCII
// case-insensitive, on word boundaries, left to right and longest first.
// All escapes are resolved before any trigger, and nothing produced by a rule
// is scanned again. Whitespace between two adjacent commands is dropped;
// all other text is copied through unchanged.
class PunctuationRewriter {
public:
    PunctuationRewriter();

    // Fails with a Configuration error when a trigger is duplicated or an
    // escape does not contain a trigger of its rule.
    static Result<PunctuationRewriter> create(std::vector<CommandRule> rules);

    std::string rewrite(std::string_view text) const;

    const std::vector<CommandRule>& rules() const { return rules_; }

private:
    enum class SegmentKind { Text, Literal, Symbol };

    struct Segment {
        SegmentKind kind;
        std::string text;
    };

    struct Phrase {
        std::vector<std::string> words;
        size_t rule;
    };

    explicit PunctuationRewriter(std::vector<CommandRule> rules);

    void compile();
    void substitute(std::vector<Segment>& segments, const std::vector<Phrase>& phrases,
                    SegmentKind kind) const;
    static std::string render(const std::vector<Segment>& segments);

    std::vector<CommandRule> rules_;
    std::vector<Phrase> escapes_;
    std::vector<Phrase> triggers_;
};

// Optional cleanup of punctuation the recognizer and the rewrite leave
// behind: repeated marks, ",." , space before marks, spaces inside quotes.
std::string tidy_punctuation(std::string_view text);
