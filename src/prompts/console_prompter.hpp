#ifndef POST_MAKER_CONSOLE_PROMPTER_HPP
#define POST_MAKER_CONSOLE_PROMPTER_HPP

#include <istream>
#include <ostream>

#include "interface.hpp"

namespace prompts {
    class ConsolePrompter : public IPrompter {
       public:
        ConsolePrompter();
        ConsolePrompter(std::istream& in, std::ostream& out);

        bool confirm(const std::string& question) override;
        std::string ask(const std::string& question) override;

       private:
        std::istream& in_;
        std::ostream& out_;
    };
}  // namespace prompts

#endif
