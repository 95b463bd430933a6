#ifndef POST_MAKER_REQUEST_EXECUTOR_HPP
#define POST_MAKER_REQUEST_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../../http/client/interface.hpp"
#include "../../prompts/interface.hpp"
#include "../../renderers/interface.hpp"
#include "../../scripts/interface.hpp"
#include "../../stores/history_store.hpp"
#include "../../stores/variable_store.hpp"
#include "../model/model.hpp"
#include "../resolver/placeholder_resolver.hpp"

namespace pipeline::executor {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // One entry of a request chain file.
    struct ChainStep {
        model::RequestDescriptor descriptor_;
        model::ExecuteOptions options_;
    };

    // Reads a JSON array of descriptor objects; "output_file" and "only" become the step's options.
    [[nodiscard]] std::vector<ChainStep> chain_from_json(const json::Value& value);

    class RequestExecutor {
       public:
        /**
         * Runs one descriptor against every target it expands to.
         *
         * Placeholders are resolved and every target is checked before anything is sent, so a
         * MissingVariable in strict mode leaves no side effects. After that, failures are reported
         * through the renderer and only abort the iteration they happen in.
         */
        model::ExecutionSummary execute(const model::RequestDescriptor& descriptor, const model::ExecuteOptions& options);

        // Sends a history record again with its output file and display filter.
        model::ExecutionSummary replay(const model::ResponseRecord& record);

        // Runs every step in order. A failing step, a missing variable included, does not stop the chain.
        model::ExecutionSummary run_chain(const std::vector<ChainStep>& steps);

        void set_http_client(std::unique_ptr<http::client::IHttpClient> http_client);
        void set_mock_client(std::unique_ptr<http::client::IHttpClient> mock_client);
        void set_variable_store(std::unique_ptr<stores::IVariableStore> variable_store);
        void set_history_store(std::unique_ptr<stores::IHistoryStore> history_store);
        void set_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        void set_prompter(std::unique_ptr<prompts::IPrompter> prompter);
        void set_script_runner(std::unique_ptr<scripts::IScriptRunner> script_runner);
        void set_sleeper(Sleeper sleeper);
        void set_debug_mode(model::DebugMode debug_mode);

        [[nodiscard]] const http::client::IHttpClient* get_http_client() const { return http_client_.get(); }
        [[nodiscard]] const http::client::IHttpClient* get_mock_client() const { return mock_client_.get(); }
        [[nodiscard]] const stores::IVariableStore* get_variable_store() const { return variable_store_.get(); }
        [[nodiscard]] const stores::IHistoryStore* get_history_store() const { return history_store_.get(); }
        [[nodiscard]] const renderers::IRenderer* get_renderer() const { return renderer_.get(); }
        [[nodiscard]] const prompts::IPrompter* get_prompter() const { return prompter_.get(); }
        [[nodiscard]] const scripts::IScriptRunner* get_script_runner() const { return script_runner_.get(); }
        [[nodiscard]] const Sleeper& get_sleeper() const { return sleeper_; }
        [[nodiscard]] model::DebugMode get_debug_mode() const { return debug_mode_; }

       private:
        enum class Outcome { SENT, SKIPPED };

        [[nodiscard]] bool is_debug() const { return debug_mode_ == model::DebugMode::ON; }

        Outcome run_iteration(const model::RequestDescriptor& descriptor, const std::string& target, const model::ExecuteOptions& options,
                              resolver::PlaceholderResolver& placeholders, model::ExecutionSummary& summary);

        void write_output(const std::string& path, const model::ResponseRecord& record, const http::model::Headers& response_headers);
        void record_history(const model::ResponseRecord& record);

        std::unique_ptr<http::client::IHttpClient> http_client_;
        std::unique_ptr<http::client::IHttpClient> mock_client_;
        std::unique_ptr<stores::IVariableStore> variable_store_;
        std::unique_ptr<stores::IHistoryStore> history_store_;
        std::unique_ptr<renderers::IRenderer> renderer_;
        std::unique_ptr<prompts::IPrompter> prompter_;
        std::unique_ptr<scripts::IScriptRunner> script_runner_;
        Sleeper sleeper_;
        model::DebugMode debug_mode_ = model::DebugMode::OFF;
    };

    class RequestExecutorBuilder {
       public:
        RequestExecutorBuilder();

        RequestExecutorBuilder& with_http_client(std::unique_ptr<http::client::IHttpClient> http_client);
        RequestExecutorBuilder& with_mock_client(std::unique_ptr<http::client::IHttpClient> mock_client);
        RequestExecutorBuilder& with_variable_store(std::unique_ptr<stores::IVariableStore> variable_store);
        RequestExecutorBuilder& with_history_store(std::unique_ptr<stores::IHistoryStore> history_store);
        RequestExecutorBuilder& with_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        RequestExecutorBuilder& with_prompter(std::unique_ptr<prompts::IPrompter> prompter);
        RequestExecutorBuilder& with_script_runner(std::unique_ptr<scripts::IScriptRunner> script_runner);
        RequestExecutorBuilder& with_sleeper(Sleeper sleeper);
        RequestExecutorBuilder& with_debug_mode(model::DebugMode debug_mode);
        RequestExecutorBuilder& validate();
        std::unique_ptr<RequestExecutor> build();

       private:
        std::unique_ptr<RequestExecutor> request_executor_;
    };
}  // namespace pipeline::executor

#endif
