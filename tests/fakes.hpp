#ifndef POST_MAKER_TESTS_FAKES_HPP
#define POST_MAKER_TESTS_FAKES_HPP

#include <chrono>
#include <deque>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <vector>

#include "../src/http/client/interface.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/pipeline/error/pipeline_error.hpp"
#include "../src/prompts/interface.hpp"
#include "../src/renderers/interface.hpp"
#include "../src/scripts/interface.hpp"
#include "../src/stores/history_store.hpp"
#include "../src/stores/variable_store.hpp"

namespace test_support {
    class FakeHttpClient : public http::client::IHttpClient {
       public:
        // sink, when given, also receives every request and outlives this client.
        explicit FakeHttpClient(std::vector<http::model::Request>* sink = nullptr) : sink_(sink) {}

        http::model::Response send(const http::model::Request& req) override {
            requests_.push_back(req);
            if (sink_ != nullptr) {
                sink_->push_back(req);
            }
            if (fail_next_ > 0) {
                --fail_next_;
                throw http::http_error::TransportError(req.url_, "connection refused");
            }
            http::model::Response r = response_;
            r.byte_length_ = r.body_.size();
            return r;
        }

        std::vector<http::model::Request> requests_;
        http::model::Response response_{.status_ = 200,
                                        .byte_length_ = 0,
                                        .reason_ = "OK",
                                        .body_ = R"({"ok": true})",
                                        .headers_ = {{"Content-Type", "application/json"}},
                                        .simulated_elapsed_ms_ = std::nullopt};
        int fail_next_ = 0;

       private:
        std::vector<http::model::Request>* sink_;
    };

    class FakeVariableStore : public stores::IVariableStore {
       public:
        explicit FakeVariableStore(pipeline::resolver::VariableMap variables = {}) : variables_(std::move(variables)) {}

        [[nodiscard]] pipeline::resolver::VariableMap load() const override { return variables_; }
        void save(const pipeline::resolver::VariableMap& variables) override { variables_ = variables; }

        pipeline::resolver::VariableMap variables_;
    };

    class FakeHistoryStore : public stores::IHistoryStore {
       public:
        void append(const pipeline::model::ResponseRecord& record) override {
            if (fail_appends_) {
                throw pipeline::error::HistoryIOError("history.json", "disk full");
            }
            records_.push_back(record);
        }
        [[nodiscard]] std::vector<pipeline::model::ResponseRecord> load_all() const override { return records_; }
        void clear() override { records_.clear(); }

        std::vector<pipeline::model::ResponseRecord> records_;
        bool fail_appends_ = false;
    };

    class RecordingRenderer : public renderers::IRenderer {
       public:
        void render_preview(const renderers::RequestPreview& preview) override { previews_.push_back(preview); }
        void render_response(const pipeline::model::ResponseRecord& record, const http::model::Headers& /*response_headers*/) override {
            responses_.push_back(record);
        }
        void render_exchange(const renderers::RequestPreview& /*request*/, const http::model::Response& /*response*/, const std::string& /*body*/,
                             bool /*mocked*/) override {
            ++exchanges_;
        }
        void render_history(const std::vector<pipeline::model::ResponseRecord>& records) override { history_ = records; }
        void info(const std::string& message) override { infos_.push_back(message); }
        void success(const std::string& message) override { successes_.push_back(message); }
        void warning(const std::string& message) override { warnings_.push_back(message); }
        void error(const std::string& message) override { errors_.push_back(message); }

        std::vector<renderers::RequestPreview> previews_;
        std::vector<pipeline::model::ResponseRecord> responses_;
        std::vector<pipeline::model::ResponseRecord> history_;
        int exchanges_ = 0;
        std::vector<std::string> infos_;
        std::vector<std::string> successes_;
        std::vector<std::string> warnings_;
        std::vector<std::string> errors_;
    };

    class ScriptedPrompter : public prompts::IPrompter {
       public:
        bool confirm(const std::string& question) override {
            questions_.push_back(question);
            return confirm_;
        }
        std::string ask(const std::string& question) override {
            questions_.push_back(question);
            if (answers_.empty()) {
                return "";
            }
            std::string answer = answers_.front();
            answers_.pop_front();
            return answer;
        }

        bool confirm_ = true;
        std::deque<std::string> answers_;
        std::vector<std::string> questions_;
    };

    class FakeScriptRunner : public scripts::IScriptRunner {
       public:
        bool run(int script_id) override {
            runs_.push_back(script_id);
            return script_id != missing_id_;
        }

        std::vector<int> runs_;
        int missing_id_ = -1;
    };

    // Unique scratch directory, removed on destruction.
    class TempDir {
       public:
        TempDir() {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() / ("post_maker_test_" + std::to_string(rd()) + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;
        TempDir(TempDir&&) = delete;
        TempDir& operator=(TempDir&&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return path_; }

       private:
        std::filesystem::path path_;
    };
}  // namespace test_support

#endif
