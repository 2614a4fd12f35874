#include "rewrite/punctuation_rewriter.hpp"

#include <cctype>
#include <format>
#include <regex>
#include <set>

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Same notion of a word character as a regex \b, with every non-ASCII byte
// counted as a letter so UTF-8 words are never split.
bool is_word(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::vector<std::string> split_words(std::string_view phrase) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : phrase) {
        if (is_space(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(lower(c));
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

std::string normalize(std::string_view phrase) {
    std::string out;
    for (const auto& w : split_words(phrase)) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

// End offset of `words` matched at `pos`, or npos. Words are separated by
// any run of whitespace and the match must end on a word boundary.
size_t match_at(std::string_view text, size_t pos, const std::vector<std::string>& words) {
    for (size_t k = 0; k < words.size(); k++) {
        if (k > 0) {
            size_t ws = pos;
            while (ws < text.size() && is_space(text[ws])) ws++;
            if (ws == pos) return std::string_view::npos;
            pos = ws;
        }

        const auto& w = words[k];
        if (text.size() - pos < w.size()) return std::string_view::npos;
        for (size_t i = 0; i < w.size(); i++) {
            if (lower(text[pos + i]) != w[i]) return std::string_view::npos;
        }
        pos += w.size();
    }

    if (pos < text.size() && is_word(text[pos])) return std::string_view::npos;
    return pos;
}

} // namespace

CommandRule make_rule(std::vector<std::string> triggers, std::string symbol) {
    CommandRule rule;
    for (const auto& t : triggers) {
        rule.escapes.push_back("actual " + t);
    }
    rule.triggers = std::move(triggers);
    rule.symbol = std::move(symbol);
    return rule;
}

const std::vector<CommandRule>& default_rules() {
    static const std::vector<CommandRule> rules = {
        make_rule({"new line", "newline"}, "\n"),
        make_rule({"inverted comma"}, "\""),
        make_rule({"comma"}, ","),
        make_rule({"full stop"}, "."),
    };
    return rules;
}

PunctuationRewriter::PunctuationRewriter()
    : PunctuationRewriter(default_rules()) {}

PunctuationRewriter::PunctuationRewriter(std::vector<CommandRule> rules)
    : rules_(std::move(rules)) {
    compile();
}

Result<PunctuationRewriter> PunctuationRewriter::create(std::vector<CommandRule> rules) {
    std::set<std::string> seen_triggers;
    std::set<std::string> seen_escapes;

    for (const auto& rule : rules) {
        if (rule.triggers.empty()) {
            return make_error(ErrorKind::Configuration,
                              std::format("rule for '{}' has no trigger phrase", rule.symbol));
        }

        std::vector<std::string> own;
        for (const auto& t : rule.triggers) {
            auto n = normalize(t);
            if (n.empty()) {
                return make_error(ErrorKind::Configuration, "empty trigger phrase");
            }
            if (!seen_triggers.insert(n).second) {
                return make_error(ErrorKind::Configuration,
                                  std::format("duplicate trigger phrase '{}'", n));
            }
            own.push_back(std::move(n));
        }

        for (const auto& e : rule.escapes) {
            auto n = normalize(e);
            bool contains_trigger = false;
            for (const auto& t : own) {
                if (n.find(t) != std::string::npos) {
                    contains_trigger = true;
                    break;
                }
            }
            if (!contains_trigger) {
                return make_error(ErrorKind::Configuration,
                                  std::format("escape phrase '{}' does not contain a trigger of its rule", n));
            }
            if (!seen_escapes.insert(n).second) {
                return make_error(ErrorKind::Configuration,
                                  std::format("duplicate escape phrase '{}'", n));
            }
        }
    }

    return PunctuationRewriter(std::move(rules));
}

void PunctuationRewriter::compile() {
    escapes_.clear();
    triggers_.clear();
    for (size_t r = 0; r < rules_.size(); r++) {
        for (const auto& e : rules_[r].escapes) {
            escapes_.push_back({split_words(e), r});
        }
        for (const auto& t : rules_[r].triggers) {
            triggers_.push_back({split_words(t), r});
        }
    }
}

std::string PunctuationRewriter::rewrite(std::string_view text) const {
    std::vector<Segment> segments;
    segments.push_back({SegmentKind::Text, std::string(text)});

    // Escapes become protected literals first, so the trigger pass below can
    // never see the words they contain.
    substitute(segments, escapes_, SegmentKind::Literal);
    substitute(segments, triggers_, SegmentKind::Symbol);

    return render(segments);
}

void PunctuationRewriter::substitute(std::vector<Segment>& segments,
                                     const std::vector<Phrase>& phrases,
                                     SegmentKind kind) const {
    std::vector<Segment> out;
    out.reserve(segments.size());

    for (auto& seg : segments) {
        if (seg.kind != SegmentKind::Text) {
            out.push_back(std::move(seg));
            continue;
        }

        std::string_view t = seg.text;
        size_t plain_start = 0;
        size_t i = 0;

        while (i < t.size()) {
            bool at_boundary = (i == 0 || !is_word(t[i - 1])) && is_word(t[i]);
            if (!at_boundary) {
                i++;
                continue;
            }

            size_t best_end = std::string_view::npos;
            size_t best_rule = 0;
            for (const auto& p : phrases) {
                size_t end = match_at(t, i, p.words);
                if (end != std::string_view::npos &&
                    (best_end == std::string_view::npos || end > best_end)) {
                    best_end = end;
                    best_rule = p.rule;
                }
            }

            if (best_end == std::string_view::npos) {
                i++;
                continue;
            }

            if (i > plain_start) {
                out.push_back({SegmentKind::Text, std::string(t.substr(plain_start, i - plain_start))});
            }
            const auto& rule = rules_[best_rule];
            out.push_back({kind, kind == SegmentKind::Literal ? rule.literal() : rule.symbol});
            i = plain_start = best_end;
        }

        if (plain_start < t.size()) {
            out.push_back({SegmentKind::Text, std::string(t.substr(plain_start))});
        }
    }

    segments = std::move(out);
}

std::string PunctuationRewriter::render(const std::vector<Segment>& segments) {
    auto blank = [](const std::string& s) {
        for (char c : s) {
            if (!is_space(c)) return false;
        }
        return true;
    };

    std::string out;
    for (size_t i = 0; i < segments.size(); i++) {
        const auto& seg = segments[i];
        // A gap between two commands is dropped only next to a symbol;
        // consecutive literal words keep their spacing.
        bool beside_symbol = seg.kind == SegmentKind::Text && blank(seg.text) &&
                             i > 0 && i + 1 < segments.size() &&
                             segments[i - 1].kind != SegmentKind::Text &&
                             segments[i + 1].kind != SegmentKind::Text &&
                             (segments[i - 1].kind == SegmentKind::Symbol ||
                              segments[i + 1].kind == SegmentKind::Symbol);
        if (beside_symbol) continue;
        out += seg.text;
    }
    return out;
}

std::string tidy_punctuation(std::string_view text) {
    static const std::regex repeated_mark(R"(([,.!?])(?:\s*\1)+)");
    static const std::regex comma_then_stop(R"(,\s*\.)");
    static const std::regex space_before_mark(R"(\s+([,.!?]))");
    static const std::regex space_after_quote(R"("\s+)");
    static const std::regex space_before_quote(R"(\s+")");
    static const std::regex quote_then_comma(R"(",)");
    static const std::regex comma_then_quote(R"(,")");

    std::string s(text);
    s = std::regex_replace(s, repeated_mark, "$1");
    s = std::regex_replace(s, comma_then_stop, ".");
    s = std::regex_replace(s, space_before_mark, "$1");
    s = std::regex_replace(s, space_after_quote, "\"");
    s = std::regex_replace(s, space_before_quote, "\"");
    s = std::regex_replace(s, quote_then_comma, "\"");
    s = std::regex_replace(s, comma_then_quote, " \"");
    return s;
}
