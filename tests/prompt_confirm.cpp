#include <catch2/catch.hpp>
#include "PromptManager.hpp"
#include "fakes.hpp"

#include <sstream>
#include <string>

namespace {
    bool confirm_with(const std::string& input, bool defaultValue) {
        FakeTerminal term(false);
        ScriptedSelectionList list;
        std::istringstream in(input);
        std::ostringstream status;
        PromptManager prompts(term, in, status, list);
        return prompts.promptConfirm("Continue?", defaultValue);
    }
}

TEST_CASE("promptConfirm: empty line gives the default", "[prompt][confirm]") {
    REQUIRE(confirm_with("\n", true));
    REQUIRE_FALSE(confirm_with("\n", false));
    REQUIRE(confirm_with("   \n", true));
}

TEST_CASE("promptConfirm: yes forms, any case", "[prompt][confirm]") {
    auto answer = GENERATE(as<std::string>{}, "y", "Y", "yes", "YES", "Yes", " yes ");
    CAPTURE(answer);
    REQUIRE(confirm_with(answer + "\n", false));
}

TEST_CASE("promptConfirm: no forms, any case", "[prompt][confirm]") {
    auto answer = GENERATE(as<std::string>{}, "n", "N", "no", "NO", "No");
    CAPTURE(answer);
    REQUIRE_FALSE(confirm_with(answer + "\n", true));
}

TEST_CASE("promptConfirm: hint shows the default side", "[prompt][confirm]") {
    FakeTerminal term(true);
    ScriptedSelectionList list;
    std::ostringstream status;

    SECTION("Default yes") {
        std::istringstream in("\n");
        PromptManager prompts(term, in, status, list);
        prompts.promptConfirm("Continue?", true);
        REQUIRE(status.str() == "Continue? [Y/n] ");
    }
    SECTION("Default no") {
        std::istringstream in("\n");
        PromptManager prompts(term, in, status, list);
        prompts.promptConfirm("Continue?", false);
        REQUIRE(status.str() == "Continue? [y/N] ");
    }
}

TEST_CASE("promptConfirm: unrecognised answer asks once more", "[prompt][confirm]") {
    FakeTerminal term(true);
    ScriptedSelectionList list;
    std::istringstream in("maybe\nn\n");
    std::ostringstream status;
    PromptManager prompts(term, in, status, list);

    REQUIRE_FALSE(prompts.promptConfirm("Continue?", true));
    REQUIRE(status.str() ==
            "Continue? [Y/n] Please answer y or n.\n"
            "Continue? [Y/n] ");
}

TEST_CASE("promptConfirm: only invalid lines then end of input", "[prompt][confirm]") {
    REQUIRE_THROWS_AS(confirm_with("maybe\nperhaps\n", true), InputExhausted);
    REQUIRE_THROWS_AS(confirm_with("", false), InputExhausted);
}
