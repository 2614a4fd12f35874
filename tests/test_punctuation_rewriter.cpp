#include <catch2/catch_test_macros.hpp>

#include "rewrite/punctuation_rewriter.hpp"

#include <string>

TEST_CASE("PunctuationRewriter", "[rewrite]") {
    PunctuationRewriter rw;

    SECTION("EndToEndMixedCommands") {
        REQUIRE(rw.rewrite("new line actual new line comma actual comma full stop") ==
                "\nnew line,comma.");
    }

    SECTION("ConsecutiveEscapesKeepTheirSpacing") {
        REQUIRE(rw.rewrite("actual comma actual full stop") == "comma full stop");
        REQUIRE(rw.rewrite("spell actual comma actual comma twice") == "spell comma comma twice");
        REQUIRE(rw.rewrite("I said actual new line actual comma please") ==
                "I said new line comma please");
        REQUIRE(rw.rewrite("actual comma comma") == "comma,");
    }

    SECTION("EscapeYieldsLiteralWords") {
        for (const auto& rule : rw.rules()) {
            for (const auto& escape : rule.escapes) {
                INFO(escape);
                auto out = rw.rewrite("I said " + escape);
                // "actual newline" restores the rule's literal form
                REQUIRE(out == "I said " + rule.literal());
            }
        }
    }

    SECTION("TriggerBecomesSymbol") {
        for (const auto& rule : rw.rules()) {
            for (const auto& trigger : rule.triggers) {
                INFO(trigger);
                REQUIRE(rw.rewrite("please add " + trigger + " here") ==
                        "please add " + rule.symbol + " here");
            }
        }
    }

    SECTION("CaseInsensitive") {
        REQUIRE(rw.rewrite("NEW LINE") == "\n");
        REQUIRE(rw.rewrite("NEW LINE") == rw.rewrite("new line"));
        REQUIRE(rw.rewrite("Full Stop") == ".");
        REQUIRE(rw.rewrite("Actual Comma") == "comma");
    }

    SECTION("PlainTextUnchanged") {
        std::string text = "Hello there, General Kenobi. It's 4 June 2023!";
        REQUIRE(rw.rewrite(text) == text);
        REQUIRE(rw.rewrite("") == "");
        REQUIRE(rw.rewrite("   \t ") == "   \t ");
    }

    SECTION("EscapeNeverProducesSymbol") {
        auto out = rw.rewrite("actual comma");
        REQUIRE(out == "comma");
        REQUIRE(out.find(',') == std::string::npos);
    }

    SECTION("WordBoundaries") {
        REQUIRE(rw.rewrite("the commander commas") == "the commander commas");
        REQUIRE(rw.rewrite("factual comma") == "factual ,");
        REQUIRE(rw.rewrite("comma's") == ",'s");
    }

    SECTION("LongestPhraseWins") {
        // "inverted comma" must not be split into "inverted" + ","
        REQUIRE(rw.rewrite("he said inverted comma hi inverted comma") == "he said \" hi \"");
        REQUIRE(rw.rewrite("actual inverted comma") == "inverted comma");
    }

    SECTION("NewlineVariants") {
        REQUIRE(rw.rewrite("one newline two") == "one \n two");
        REQUIRE(rw.rewrite("one new  line two") == "one \n two");
        REQUIRE(rw.rewrite("actual newline") == "new line");
    }

    SECTION("SurroundingPunctuationKept") {
        REQUIRE(rw.rewrite("Hello comma, world full stop.") == "Hello ,, world ..");
    }

    SECTION("NonCommandCasingPreserved") {
        REQUIRE(rw.rewrite("Dear Sir comma") == "Dear Sir ,");
    }
}

TEST_CASE("PunctuationRewriter::create", "[rewrite]") {

    SECTION("AcceptsDefaultTable") {
        auto rw = PunctuationRewriter::create(default_rules());
        REQUIRE(rw.has_value());
        REQUIRE(rw->rewrite("a comma b") == "a , b");
    }

    SECTION("RejectsDuplicateTrigger") {
        auto rw = PunctuationRewriter::create({
            make_rule({"dash"}, "-"),
            make_rule({"DASH"}, "--"),
        });
        REQUIRE_FALSE(rw.has_value());
        REQUIRE(rw.error().kind == ErrorKind::Configuration);
    }

    SECTION("RejectsEscapeWithoutTrigger") {
        CommandRule rule;
        rule.triggers = {"semicolon"};
        rule.escapes = {"literally colon"};
        rule.symbol = ";";
        auto rw = PunctuationRewriter::create({rule});
        REQUIRE_FALSE(rw.has_value());
        REQUIRE(rw.error().kind == ErrorKind::Configuration);
    }

    SECTION("CustomRuleIndependentOfOrder") {
        auto a = PunctuationRewriter::create({make_rule({"colon"}, ":"), make_rule({"semi colon"}, ";")});
        auto b = PunctuationRewriter::create({make_rule({"semi colon"}, ";"), make_rule({"colon"}, ":")});
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        std::string text = "x semi colon y colon z actual colon";
        REQUIRE(a->rewrite(text) == "x ; y : z colon");
        REQUIRE(a->rewrite(text) == b->rewrite(text));
    }
}

TEST_CASE("tidy_punctuation", "[rewrite]") {
    REQUIRE(tidy_punctuation("Hello ,, world ..") == "Hello, world.");
    REQUIRE(tidy_punctuation("yes,.") == "yes.");
    REQUIRE(tidy_punctuation("he said \" hi \" then") == "he said\"hi\"then");
    REQUIRE(tidy_punctuation("plain text") == "plain text");
}
