#include "console_prompter.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "../utils/string_utils.hpp"

namespace prompts {
    ConsolePrompter::ConsolePrompter() : ConsolePrompter(std::cin, std::cout) {}

    ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool ConsolePrompter::confirm(const std::string& question) {
        out_ << question << " (y/N): " << std::flush;

        std::string answer;
        if (!std::getline(in_, answer)) {
            return false;
        }

        answer = string_utils::to_lower(string_utils::trim(answer));
        return answer == "y" || answer == "yes";
    }

    std::string ConsolePrompter::ask(const std::string& question) {
        out_ << question << ": " << std::flush;

        std::string answer;
        if (!std::getline(in_, answer)) {
            throw std::runtime_error("Input closed while waiting for: " + question);
        }
        return answer;
    }
}  // namespace prompts
