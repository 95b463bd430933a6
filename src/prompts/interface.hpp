#ifndef POST_MAKER_PROMPTS_INTERFACE_HPP
#define POST_MAKER_PROMPTS_INTERFACE_HPP

#include <string>

namespace prompts {
    class IPrompter {
       public:
        IPrompter() = default;
        virtual ~IPrompter() = default;
        IPrompter(const IPrompter&) = delete;
        IPrompter& operator=(const IPrompter&) = delete;
        IPrompter(IPrompter&&) = delete;
        IPrompter& operator=(IPrompter&&) = delete;

        // True only for an explicit "y"/"yes" answer.
        virtual bool confirm(const std::string& question) = 0;
        virtual std::string ask(const std::string& question) = 0;
    };
}  // namespace prompts

#endif
