// src/main.cpp
#include "CursesSelectionList.hpp"
#include "PromptManager.hpp"
#include "SystemTerminal.hpp"
#include "console_io.hpp"

#include <iostream>
#include <string>
#include <vector>

// ----- Small helpers -----

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

// ----- Menu actions -----

static void action_text(PromptManager& prompts) {
    std::string name = prompts.promptText("What is your name?");
    std::cout << "Hello " << name << "!\n";
}

static void action_password(PromptManager& prompts) {
    std::string pw = prompts.promptPassword("What is your password?");
    std::cout << "Oh, I see! Your password is \"" << pw << "\"\n";
    secure_wipe(pw);
}

static void action_confirm(PromptManager& prompts) {
    bool ok = prompts.promptConfirm("Do you want to continue?", true);
    std::cout << (ok ? "Continuing.\n" : "Stopping.\n");
}

static void action_checkboxes(PromptManager& prompts) {
    const std::vector<std::string> languages = {
        "C", "Python", "Java", "C++", "C#",
        "Visual Basic", "JavaScript", "PHP", "Assembly Language", "SQL",
        "Groovy", "Classic Visual Basic", "Fortran", "R", "Ruby",
        "Swift", "MATLAB", "Go", "Prolog", "Perl",
    };
    auto answers = prompts.promptMultiSelect(
        "Which are your favourite programming languages?", languages);
    std::cout << "Oh, I see! You like " << join(answers, ", ") << "\n";
}

static void action_tty(const PromptManager& prompts) {
    if (prompts.isInteractive()) {
        std::cout << "Terminal is interactive! You're good to use prompts!\n";
    } else {
        std::cout << "Terminal is not interactive! Consider using flags or environment variables!\n";
    }
}

// ----- Main -----

int main() {
    try {
        SystemTerminal terminal;            // stdin, resolved once
        CursesSelectionList selector;       // keys from stdin, drawn on stderr
        PromptManager prompts(terminal, std::cin, std::cerr, selector);

        for (;;) {
            prompts.printLine("\n=== Prompt demos ===\n"
                              "1) Text input\n"
                              "2) Password input\n"
                              "3) Yes/No confirmation\n"
                              "4) Checkboxes\n"
                              "5) Is the terminal interactive?\n"
                              "q) Quit");
            std::string choice = prompts.promptText(">");

            if (choice == "1") action_text(prompts);
            else if (choice == "2") action_password(prompts);
            else if (choice == "3") action_confirm(prompts);
            else if (choice == "4") action_checkboxes(prompts);
            else if (choice == "5") action_tty(prompts);
            else if (choice == "q" || choice == "Q") break;
            else prompts.printLine("Unknown option.");
        }

        return 0;
    } catch (const PromptError& ex) {
        std::cerr << "[Error] " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
