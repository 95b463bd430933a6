#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "src/cli/commands.hpp"
#include "src/config/settings.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/pipeline/error/pipeline_error.hpp"
#include "src/pipeline/executor/request_executor.hpp"
#include "src/prompts/console_prompter.hpp"
#include "src/renderers/console_renderer.hpp"
#include "src/scripts/python_script_runner.hpp"
#include "src/stores/history_store.hpp"
#include "src/stores/variable_store.hpp"
#include "src/utils/constants.hpp"

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        const std::vector<std::string> args(argv + 1, argv + argc);
        const config::Settings settings = config::Settings::from_environment();

        settings.ensure_layout();
        scripts::PythonScriptRunner(settings.scripts_dir()).ensure_default_scripts();

        http::client::CurlGlobal curl_global;

        renderers::ConsoleRenderer renderer;
        prompts::ConsolePrompter prompter;

        //
        // Wire
        //

        auto make_executor = [&settings](pipeline::model::DebugMode debug_mode) {
            return pipeline::executor::RequestExecutorBuilder()
                .with_http_client(std::make_unique<http::client::CurlEasy>(settings.get_curl_options()))
                .with_variable_store(std::make_unique<stores::FileVariableStore>(settings.data_file(constants::VARIABLES_FILE)))
                .with_history_store(std::make_unique<stores::FileHistoryStore>(settings.data_file(constants::HISTORY_FILE)))
                .with_renderer(std::make_unique<renderers::ConsoleRenderer>())
                .with_prompter(std::make_unique<prompts::ConsolePrompter>())
                .with_script_runner(std::make_unique<scripts::PythonScriptRunner>(settings.scripts_dir()))
                .with_debug_mode(debug_mode)
                .validate()
                .build();
        };

        cli::CommandDispatcher dispatcher(settings, make_executor, renderer, prompter);

        //
        // Run
        //

        if (args.empty()) {
            return dispatcher.run_shell(std::cin, std::cout);
        }
        return dispatcher.dispatch(args);
    } catch (const http::http_error::TransportError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return cli::ExitCodes::FAILURE;
    } catch (const pipeline::error::MissingVariable& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return cli::ExitCodes::MISSING_VARIABLE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return cli::ExitCodes::FAILURE;
    }
}
