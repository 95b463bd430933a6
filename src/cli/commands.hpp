#ifndef POST_MAKER_COMMANDS_HPP
#define POST_MAKER_COMMANDS_HPP

#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "../config/settings.hpp"
#include "../pipeline/executor/request_executor.hpp"
#include "../prompts/interface.hpp"
#include "../renderers/interface.hpp"
#include "../stores/alias_store.hpp"
#include "../stores/history_store.hpp"
#include "../stores/template_store.hpp"
#include "../stores/variable_store.hpp"

namespace cli {
    struct ExitCodes {
        static constexpr int OK = 0;
        static constexpr int FAILURE = 1;
        static constexpr int MISSING_VARIABLE = 2;
        static constexpr int USAGE = 3;
    };

    // Builds a fully wired executor for the current debug mode.
    using ExecutorFactory = std::function<std::unique_ptr<pipeline::executor::RequestExecutor>(pipeline::model::DebugMode)>;

    class CommandDispatcher {
       public:
        CommandDispatcher(config::Settings settings, ExecutorFactory executor_factory, renderers::IRenderer& renderer, prompts::IPrompter& prompter);

        // args[0] is the command name. Returns one of ExitCodes.
        int dispatch(const std::vector<std::string>& args);

        // Reads command lines until end of input or "exit". Returns the exit code of the last command.
        int run_shell(std::istream& in, std::ostream& out);

       private:
        using Handler = int (CommandDispatcher::*)(const std::vector<std::string>&);

        int cmd_request(const std::vector<std::string>& args);
        int cmd_send(const std::vector<std::string>& args);
        int cmd_save(const std::vector<std::string>& args);
        int cmd_history(const std::vector<std::string>& args);
        int cmd_replay(const std::vector<std::string>& args);
        int cmd_chain(const std::vector<std::string>& args);
        int cmd_setvar(const std::vector<std::string>& args);
        int cmd_vars(const std::vector<std::string>& args);
        int cmd_debug(const std::vector<std::string>& args);
        int cmd_importcurl(const std::vector<std::string>& args);
        int cmd_exportcurl(const std::vector<std::string>& args);
        int cmd_template(const std::vector<std::string>& args);
        int cmd_collections(const std::vector<std::string>& args);
        int cmd_aliases(const std::vector<std::string>& args);
        int cmd_diff(const std::vector<std::string>& args);
        int cmd_export(const std::vector<std::string>& args);
        int cmd_import(const std::vector<std::string>& args);
        int cmd_reset(const std::vector<std::string>& args);
        int cmd_help(const std::vector<std::string>& args);
        int cmd_version(const std::vector<std::string>& args);

        int execute(const pipeline::model::RequestDescriptor& descriptor, const pipeline::model::ExecuteOptions& options, bool save_prompted);
        int finish(const pipeline::model::ExecutionSummary& summary, bool save_prompted);
        void render_descriptor(const std::string& alias, const pipeline::model::RequestDescriptor& descriptor);

        config::Settings settings_;
        ExecutorFactory executor_factory_;
        renderers::IRenderer& renderer_;
        prompts::IPrompter& prompter_;

        stores::AliasStore alias_store_;
        stores::TemplateStore template_store_;
        stores::FileVariableStore variable_store_;
        stores::FileHistoryStore history_store_;
    };
}  // namespace cli

#endif
