#include "request_executor.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "../../http/client/mock_client.hpp"
#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../assertions/assertion.hpp"
#include "../auth/auth.hpp"
#include "../error/pipeline_error.hpp"
#include "../output/output_report.hpp"
#include "../targets/target_expander.hpp"

namespace pipeline::executor {
    namespace {
        // Local time, e.g. 2024-05-01T13:45:10.123456
        std::string iso_timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t secs = std::chrono::system_clock::to_time_t(now);
            const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1'000'000;

            std::tm local{};
            localtime_r(&secs, &local);

            std::ostringstream oss;
            oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
            return oss.str();
        }

        // Pretty JSON when the body parses, the raw text otherwise.
        std::string render_body(const std::string& raw) {
            try {
                return json::Value::parse(raw).dump(constants::JSON_INDENT);
            } catch (const json::ParseError&) {
                return raw;
            }
        }

        std::string iteration_context(const std::string& target, int iteration, int iterations) {
            std::string context = " (URL: " + target;
            if (iterations > 1) {
                context += ", iteration " + std::to_string(iteration + 1) + "/" + std::to_string(iterations);
            }
            return context + ")";
        }
    }  // namespace

    std::vector<ChainStep> chain_from_json(const json::Value& value) {
        if (!value.is_array()) {
            throw std::runtime_error("A request chain must be a JSON array");
        }

        std::vector<ChainStep> steps;
        for (const auto& entry : value.as_array()) {
            ChainStep step{.descriptor_ = model::descriptor_from_json(entry), .options_ = {}};
            if (const json::Value* output = entry.find("output_file"); output != nullptr && output->is_string()) {
                step.options_.output_file_ = output->as_string();
            }
            if (const json::Value* only = entry.find("only"); only != nullptr && only->is_string()) {
                step.options_.display_filter_ = model::parse_display_filter(only->as_string());
            }
            steps.push_back(std::move(step));
        }
        return steps;
    }

    //
    // RequestExecutorBuilder implementation
    //

    RequestExecutorBuilder::RequestExecutorBuilder() : request_executor_(std::make_unique<RequestExecutor>()) {}

    RequestExecutorBuilder& RequestExecutorBuilder::with_http_client(std::unique_ptr<http::client::IHttpClient> http_client) {
        request_executor_->set_http_client(std::move(http_client));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_mock_client(std::unique_ptr<http::client::IHttpClient> mock_client) {
        request_executor_->set_mock_client(std::move(mock_client));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_variable_store(std::unique_ptr<stores::IVariableStore> variable_store) {
        request_executor_->set_variable_store(std::move(variable_store));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_history_store(std::unique_ptr<stores::IHistoryStore> history_store) {
        request_executor_->set_history_store(std::move(history_store));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_renderer(std::unique_ptr<renderers::IRenderer> renderer) {
        request_executor_->set_renderer(std::move(renderer));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_prompter(std::unique_ptr<prompts::IPrompter> prompter) {
        request_executor_->set_prompter(std::move(prompter));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_script_runner(std::unique_ptr<scripts::IScriptRunner> script_runner) {
        request_executor_->set_script_runner(std::move(script_runner));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_sleeper(Sleeper sleeper) {
        request_executor_->set_sleeper(std::move(sleeper));
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_debug_mode(model::DebugMode debug_mode) {
        request_executor_->set_debug_mode(debug_mode);
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::validate() {
        if (request_executor_->get_http_client() == nullptr) {
            throw std::runtime_error("HTTP client is required");
        }
        if (request_executor_->get_variable_store() == nullptr) {
            throw std::runtime_error("Variable store is required");
        }
        if (request_executor_->get_history_store() == nullptr) {
            throw std::runtime_error("History store is required");
        }
        if (request_executor_->get_renderer() == nullptr) {
            throw std::runtime_error("Renderer is required");
        }
        if (request_executor_->get_prompter() == nullptr) {
            throw std::runtime_error("Prompter is required");
        }
        if (request_executor_->get_script_runner() == nullptr) {
            throw std::runtime_error("Script runner is required");
        }
        return *this;
    }

    std::unique_ptr<RequestExecutor> RequestExecutorBuilder::build() {
        if (request_executor_->get_mock_client() == nullptr) {
            request_executor_->set_mock_client(std::make_unique<http::client::MockClient>());
        }
        if (!request_executor_->get_sleeper()) {
            request_executor_->set_sleeper([](std::chrono::milliseconds ms) { std::this_thread::sleep_for(ms); });
        }
        return std::move(request_executor_);
    }

    //
    // RequestExecutor implementation
    //

    void RequestExecutor::set_http_client(std::unique_ptr<http::client::IHttpClient> http_client) { http_client_ = std::move(http_client); }

    void RequestExecutor::set_mock_client(std::unique_ptr<http::client::IHttpClient> mock_client) { mock_client_ = std::move(mock_client); }

    void RequestExecutor::set_variable_store(std::unique_ptr<stores::IVariableStore> variable_store) { variable_store_ = std::move(variable_store); }

    void RequestExecutor::set_history_store(std::unique_ptr<stores::IHistoryStore> history_store) { history_store_ = std::move(history_store); }

    void RequestExecutor::set_renderer(std::unique_ptr<renderers::IRenderer> renderer) { renderer_ = std::move(renderer); }

    void RequestExecutor::set_prompter(std::unique_ptr<prompts::IPrompter> prompter) { prompter_ = std::move(prompter); }

    void RequestExecutor::set_script_runner(std::unique_ptr<scripts::IScriptRunner> script_runner) { script_runner_ = std::move(script_runner); }

    void RequestExecutor::set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    void RequestExecutor::set_debug_mode(model::DebugMode debug_mode) { debug_mode_ = debug_mode; }

    model::ExecutionSummary RequestExecutor::execute(const model::RequestDescriptor& descriptor, const model::ExecuteOptions& options) {
        if (options.repeat_ < 1) {
            throw error::PipelineError("repeat must be at least 1");
        }
        if (options.interval_ms_ < 0) {
            throw error::PipelineError("interval must not be negative");
        }

        resolver::VariableMap variables = variable_store_->load();

        resolver::UnknownVariableHandler on_unknown;
        if (options.fill_variables_) {
            on_unknown = [this](const std::string& name) { return prompter_->ask("Enter value for variable '" + name + "'"); };
        }
        resolver::PlaceholderResolver placeholders(variables, on_unknown);

        // Everything a dispatch needs is resolved once here, so a strict failure aborts before the first send.
        (void)placeholders.resolve(descriptor.method_);
        (void)placeholders.resolve(descriptor.headers_);
        if (descriptor.body_) {
            (void)placeholders.resolve(*descriptor.body_);
        }
        const std::vector<std::string> targets = targets::expand_targets(placeholders.resolve(descriptor.url_));
        for (const auto& target : targets) {
            (void)placeholders.resolve(target);
        }

        model::ExecutionSummary summary;
        const int iterations = is_debug() ? options.repeat_ : 1;

        for (const auto& target : targets) {
            for (int i = 0; i < iterations; ++i) {
                try {
                    if (run_iteration(descriptor, target, options, placeholders, summary) == Outcome::SKIPPED) {
                        ++summary.skipped_;
                    }
                } catch (const http::http_error::TransportError& e) {
                    ++summary.failed_;
                    renderer_->error("Request failed: " + std::string(e.what()) + iteration_context(e.url_, i, iterations));
                } catch (const error::PipelineError& e) {
                    ++summary.failed_;
                    renderer_->error("Error: " + std::string(e.what()) + iteration_context(target, i, iterations));
                } catch (const std::runtime_error& e) {
                    ++summary.failed_;
                    renderer_->error("Error: " + std::string(e.what()) + iteration_context(target, i, iterations));
                }

                if (i + 1 < iterations && options.interval_ms_ > 0) {
                    sleeper_(std::chrono::milliseconds(options.interval_ms_));
                }
            }
        }

        for (const auto& name : placeholders.captured()) {
            summary.prompted_variables_.emplace_back(name, variables.at(name));
        }

        return summary;
    }

    RequestExecutor::Outcome RequestExecutor::run_iteration(const model::RequestDescriptor& descriptor, const std::string& target,
                                                            const model::ExecuteOptions& options, resolver::PlaceholderResolver& placeholders,
                                                            model::ExecutionSummary& summary) {
        renderers::RequestPreview request{
            .method_ = string_utils::to_upper(placeholders.resolve(descriptor.method_)),
            .url_ = string_utils::trim(placeholders.resolve(target)),
            .headers_ = placeholders.resolve(descriptor.headers_),
            .body_ = model::normalize_body(descriptor.body_ ? std::optional<json::Value>(placeholders.resolve(*descriptor.body_)) : std::nullopt),
        };

        const std::optional<std::string>& auth = options.auth_override_ ? options.auth_override_ : descriptor.auth_;
        if (auth) {
            http::model::merge_headers(request.headers_, auth::synthesize_auth(*auth));
        }

        if (options.preview_ || (options.dry_run_ && is_debug())) {
            renderer_->render_preview(request);
            if (options.dry_run_) {
                renderer_->warning("[DRY RUN] No request sent. Use this to verify what would be sent.");
                return Outcome::SKIPPED;
            }
            if (!prompter_->confirm("Send this request?")) {
                renderer_->warning("Cancelled.");
                return Outcome::SKIPPED;
            }
        }

        const bool mocked = options.mock_ && is_debug();
        http::client::IHttpClient* client = mocked ? mock_client_.get() : http_client_.get();

        http::model::Request req{
            .url_ = request.url_,
            .method_ = request.method_,
            .body_ = request.body_ ? std::optional<std::string>(request.body_->dump()) : std::nullopt,
            .headers_ = request.headers_,
        };

        const auto start = std::chrono::steady_clock::now();
        http::model::Response response = client->send(req);
        const std::chrono::duration<double, std::milli> measured = std::chrono::steady_clock::now() - start;
        ++summary.dispatched_;

        const std::string body = render_body(response.body_);

        if (options.verbose_ && is_debug()) {
            renderer_->render_exchange(request, response, body, mocked);
        }

        model::ResponseRecord record{
            .method_ = request.method_,
            .url_ = request.url_,
            .headers_ = request.headers_,
            .body_ = request.body_,
            .output_file_ = options.output_file_,
            .display_filter_ = options.display_filter_,
            .status_ = response.status_,
            .reason_ = response.reason_,
            .elapsed_ms_ = response.simulated_elapsed_ms_.value_or(measured.count()),
            .size_bytes_ = response.byte_length_,
            .timestamp_ = iso_timestamp(),
            .response_body_ = body,
        };

        renderer_->render_response(record, response.headers_);

        if (options.output_file_) {
            write_output(*options.output_file_, record, response.headers_);
        }

        if (!(options.skip_history_ && is_debug())) {
            record_history(record);
        }

        summary.records_.push_back(record);

        if (options.assertion_) {
            assertions::AssertionEvaluator evaluator(renderer_.get(), script_runner_.get());
            (void)evaluator.evaluate(*options.assertion_, record);
        }

        return Outcome::SENT;
    }

    void RequestExecutor::write_output(const std::string& path, const model::ResponseRecord& record, const http::model::Headers& response_headers) {
        try {
            output::write_report(path, output::format_report(record.method_, record.status_, record.reason_, response_headers, record.response_body_));
            renderer_->success("Response written to '" + path + "'");
        } catch (const error::OutputWriteError& e) {
            renderer_->error(e.what());
        }
    }

    void RequestExecutor::record_history(const model::ResponseRecord& record) {
        try {
            history_store_->append(record);
        } catch (const error::HistoryIOError& e) {
            renderer_->error(std::string("Could not save history: ") + e.what());
        }
    }

    model::ExecutionSummary RequestExecutor::replay(const model::ResponseRecord& record) {
        const model::RequestDescriptor descriptor{
            .method_ = record.method_,
            .url_ = record.url_,
            .headers_ = record.headers_,
            .body_ = record.body_,
            .auth_ = std::nullopt,
        };

        model::ExecuteOptions options;
        options.output_file_ = record.output_file_;
        options.display_filter_ = record.display_filter_;
        return execute(descriptor, options);
    }

    model::ExecutionSummary RequestExecutor::run_chain(const std::vector<ChainStep>& steps) {
        model::ExecutionSummary total;

        for (const auto& step : steps) {
            renderer_->info("Running: " + step.descriptor_.method_ + " " + step.descriptor_.url_);
            try {
                model::ExecutionSummary summary = execute(step.descriptor_, step.options_);
                total.dispatched_ += summary.dispatched_;
                total.failed_ += summary.failed_;
                total.skipped_ += summary.skipped_;
                std::move(summary.records_.begin(), summary.records_.end(), std::back_inserter(total.records_));
                std::move(summary.prompted_variables_.begin(), summary.prompted_variables_.end(), std::back_inserter(total.prompted_variables_));
            } catch (const error::PipelineError& e) {
                ++total.failed_;
                renderer_->error("Error: " + std::string(e.what()));
            } catch (const std::runtime_error& e) {
                ++total.failed_;
                renderer_->error("Error: " + std::string(e.what()));
            }
        }

        return total;
    }
}  // namespace pipeline::executor
