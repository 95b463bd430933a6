#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>

#include "../src/cli/commands.hpp"
#include "../src/stores/json_file.hpp"
#include "../src/utils/constants.hpp"
#include "fakes.hpp"

using cli::ExitCodes;
using pipeline::model::DebugMode;

namespace {
    class CommandDispatcherTest : public ::testing::Test {
       protected:
        CommandDispatcherTest() : settings_(home_.path()) {
            settings_.ensure_layout();
            dispatcher_ = std::make_unique<cli::CommandDispatcher>(settings_, make_factory(), renderer_, prompter_);
        }

        cli::ExecutorFactory make_factory() {
            return [this](DebugMode debug_mode) {
                return pipeline::executor::RequestExecutorBuilder()
                    .with_http_client(std::make_unique<test_support::FakeHttpClient>(&sent_))
                    .with_variable_store(std::make_unique<stores::FileVariableStore>(settings_.data_file(constants::VARIABLES_FILE)))
                    .with_history_store(std::make_unique<stores::FileHistoryStore>(settings_.data_file(constants::HISTORY_FILE)))
                    .with_renderer(std::make_unique<test_support::RecordingRenderer>())
                    .with_prompter(std::make_unique<test_support::ScriptedPrompter>())
                    .with_script_runner(std::make_unique<test_support::FakeScriptRunner>())
                    .with_sleeper([](std::chrono::milliseconds) {})
                    .with_debug_mode(debug_mode)
                    .validate()
                    .build();
            };
        }

        int run(const std::vector<std::string>& args) { return dispatcher_->dispatch(args); }

        std::string write_file(const std::string& name, const std::string& content) {
            const auto path = home_.path() / name;
            stores::write_atomic(path, content);
            return path.string();
        }

        [[nodiscard]] pipeline::resolver::VariableMap variables() const {
            return stores::FileVariableStore(settings_.data_file(constants::VARIABLES_FILE)).load();
        }

        [[nodiscard]] stores::AliasStore aliases() const {
            return stores::AliasStore(settings_.data_file(constants::COLLECTIONS_FILE), settings_.data_file(constants::GLOBAL_ALIASES_FILE));
        }

        test_support::TempDir home_;
        config::Settings settings_;
        test_support::RecordingRenderer renderer_;
        test_support::ScriptedPrompter prompter_;
        std::vector<http::model::Request> sent_;
        std::unique_ptr<cli::CommandDispatcher> dispatcher_;
    };
}  // namespace

TEST_F(CommandDispatcherTest, UnknownCommandIsUsageError) {
    EXPECT_EQ(run({"frobnicate"}), ExitCodes::USAGE);
    EXPECT_FALSE(renderer_.errors_.empty());
}

TEST_F(CommandDispatcherTest, RequestWithoutUrlIsUsageError) {
    EXPECT_EQ(run({"request", "-m", "GET"}), ExitCodes::USAGE);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(CommandDispatcherTest, SavedVariablesAreResolved) {
    ASSERT_EQ(run({"setvar", "host", "example.com"}), ExitCodes::OK);
    ASSERT_EQ(run({"request", "-u", "https://{{host}}/a", "-m", "post", "-d", R"({"x": 1})"}), ExitCodes::OK);

    ASSERT_EQ(sent_.size(), 1U);
    EXPECT_EQ(sent_[0].url_, "https://example.com/a");
    EXPECT_EQ(sent_[0].method_, "POST");
    EXPECT_EQ(sent_[0].body_, R"({"x": 1})");
}

TEST_F(CommandDispatcherTest, MissingVariableHasItsOwnExitCode) {
    EXPECT_EQ(run({"request", "-u", "https://{{nope}}/a"}), ExitCodes::MISSING_VARIABLE);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(CommandDispatcherTest, SaveThenSendFromCollection) {
    ASSERT_EQ(run({"save", "-a", "ping", "-c", "health", "-u", "https://example.com/ping"}), ExitCodes::OK);

    EXPECT_EQ(run({"send", "-a", "ping", "-c", "health"}), ExitCodes::OK);
    ASSERT_EQ(sent_.size(), 1U);
    EXPECT_EQ(sent_[0].url_, "https://example.com/ping");

    EXPECT_EQ(run({"send", "-a", "ping"}), ExitCodes::FAILURE);
    EXPECT_EQ(sent_.size(), 1U);
}

TEST_F(CommandDispatcherTest, ReplaySendsHistoryEntry) {
    ASSERT_EQ(run({"request", "-u", "https://example.com/a", "-m", "DELETE"}), ExitCodes::OK);

    EXPECT_EQ(run({"replay", "0"}), ExitCodes::OK);
    ASSERT_EQ(sent_.size(), 2U);
    EXPECT_EQ(sent_[1].method_, "DELETE");

    EXPECT_EQ(run({"replay", "7"}), ExitCodes::FAILURE);
    EXPECT_EQ(run({"replay", "first"}), ExitCodes::USAGE);
}

TEST_F(CommandDispatcherTest, DebugModeIsPersisted) {
    EXPECT_EQ(settings_.load_debug_mode(), DebugMode::OFF);

    ASSERT_EQ(run({"debug", "on"}), ExitCodes::OK);
    EXPECT_EQ(settings_.load_debug_mode(), DebugMode::ON);

    ASSERT_EQ(run({"debug", "toggle"}), ExitCodes::OK);
    EXPECT_EQ(settings_.load_debug_mode(), DebugMode::OFF);

    EXPECT_EQ(run({"debug", "sideways"}), ExitCodes::USAGE);
}

TEST_F(CommandDispatcherTest, DryRunFollowsDebugMode) {
    ASSERT_EQ(run({"request", "-u", "https://example.com/a", "-dr"}), ExitCodes::OK);
    EXPECT_EQ(sent_.size(), 1U);

    ASSERT_EQ(run({"debug", "on"}), ExitCodes::OK);
    ASSERT_EQ(run({"request", "-u", "https://example.com/a", "-dr"}), ExitCodes::OK);
    EXPECT_EQ(sent_.size(), 1U);
}

TEST_F(CommandDispatcherTest, CurlImportAndExport) {
    ASSERT_EQ(run({"importcurl", "curl -X POST -H 'Accept: text/plain' https://example.com/items", "-a", "items"}), ExitCodes::OK);
    ASSERT_EQ(run({"exportcurl", "-a", "items"}), ExitCodes::OK);

    ASSERT_FALSE(renderer_.infos_.empty());
    EXPECT_EQ(renderer_.infos_.back(), "curl -X POST -H 'Accept: text/plain' https://example.com/items");

    EXPECT_EQ(run({"importcurl", "wget https://example.com", "-a", "bad"}), ExitCodes::FAILURE);
}

TEST_F(CommandDispatcherTest, TemplateSaveAndUse) {
    ASSERT_EQ(run({"template", "save", "-n", "create", "-m", "PUT", "-u", "https://example.com/items/1"}), ExitCodes::OK);

    prompter_.confirm_ = false;
    EXPECT_EQ(run({"template", "use", "create"}), ExitCodes::OK);
    EXPECT_TRUE(sent_.empty());

    prompter_.confirm_ = true;
    EXPECT_EQ(run({"template", "use", "create"}), ExitCodes::OK);
    ASSERT_EQ(sent_.size(), 1U);
    EXPECT_EQ(sent_[0].method_, "PUT");

    EXPECT_EQ(run({"template", "use", "missing"}), ExitCodes::FAILURE);
    EXPECT_EQ(run({"template", "delete", "-n", "create"}), ExitCodes::OK);
    EXPECT_EQ(run({"template", "delete", "-n", "create"}), ExitCodes::FAILURE);
}

TEST_F(CommandDispatcherTest, VarsRemoveAsksFirst) {
    ASSERT_EQ(run({"setvar", "token", "abc", "def"}), ExitCodes::OK);
    EXPECT_EQ(stores::FileVariableStore(settings_.data_file(constants::VARIABLES_FILE)).load().at("token"), "abc def");

    prompter_.confirm_ = false;
    ASSERT_EQ(run({"vars", "-rm", "token"}), ExitCodes::OK);
    EXPECT_EQ(stores::FileVariableStore(settings_.data_file(constants::VARIABLES_FILE)).load().size(), 1U);

    prompter_.confirm_ = true;
    ASSERT_EQ(run({"vars", "-rm", "token"}), ExitCodes::OK);
    EXPECT_TRUE(stores::FileVariableStore(settings_.data_file(constants::VARIABLES_FILE)).load().empty());
}

TEST_F(CommandDispatcherTest, ShellRunsUntilExit) {
    std::istringstream in("version\n\nexit\nversion\n");
    std::ostringstream out;

    EXPECT_EQ(dispatcher_->run_shell(in, out), ExitCodes::OK);

    const auto versions = std::count(renderer_.infos_.begin(), renderer_.infos_.end(), std::string("PostMaker v") + constants::VERSION);
    EXPECT_EQ(versions, 1);
    EXPECT_NE(out.str().find("post_maker> "), std::string::npos);
}

TEST_F(CommandDispatcherTest, RepeatOutsideIntRangeIsUsageError) {
    EXPECT_EQ(run({"request", "-u", "https://example.com/a", "-r", "4294967297"}), ExitCodes::USAGE);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(CommandDispatcherTest, DiffComparesHistoryBodies) {
    stores::FileHistoryStore history(settings_.data_file(constants::HISTORY_FILE));
    pipeline::model::ResponseRecord record;
    record.url_ = "https://example.com/a";
    record.response_body_ = "{\n  \"a\": 1,\n  \"b\": 2\n}";
    history.append(record);
    record.response_body_ = "{\n  \"a\": 1,\n  \"b\": 3\n}";
    history.append(record);

    ASSERT_EQ(run({"diff", "0", "1"}), ExitCodes::OK);

    const std::vector<std::string> expected_infos = {"--- history[0]", "+++ history[1]", "@@ -1,4 +1,4 @@", " {", "   \"a\": 1,", " }"};
    EXPECT_EQ(renderer_.infos_, expected_infos);
    EXPECT_EQ(renderer_.errors_, std::vector<std::string>{"-  \"b\": 2"});
    EXPECT_EQ(renderer_.successes_, std::vector<std::string>{"+  \"b\": 3"});

    EXPECT_EQ(run({"diff", "0", "2"}), ExitCodes::FAILURE);
    EXPECT_EQ(run({"diff", "0"}), ExitCodes::USAGE);
}

TEST_F(CommandDispatcherTest, DiffComparesFiles) {
    const std::string before = write_file("before.txt", "one\ntwo\n");
    const std::string after = write_file("after.txt", "one\ntwo\nthree\n");

    ASSERT_EQ(run({"diff", before, after}), ExitCodes::OK);
    EXPECT_EQ(renderer_.successes_, std::vector<std::string>{"+three"});

    renderer_.infos_.clear();
    ASSERT_EQ(run({"diff", before, before}), ExitCodes::OK);
    EXPECT_EQ(renderer_.infos_, std::vector<std::string>{"No differences."});

    EXPECT_EQ(run({"diff", before, (home_.path() / "missing.txt").string()}), ExitCodes::FAILURE);
}

TEST_F(CommandDispatcherTest, ExportAllThenImportRestoresStores) {
    ASSERT_EQ(run({"setvar", "host", "example.com"}), ExitCodes::OK);
    ASSERT_EQ(run({"save", "-a", "ping", "-u", "https://{{host}}/ping"}), ExitCodes::OK);
    ASSERT_EQ(run({"save", "-a", "list", "-c", "items", "-u", "https://{{host}}/items"}), ExitCodes::OK);

    const std::string bundle = (home_.path() / "bundle.json").string();
    ASSERT_EQ(run({"export", "all", bundle}), ExitCodes::OK);

    const auto doc = stores::read_json_file(bundle);
    ASSERT_TRUE(doc.has_value());
    for (const char* section : {"collections", "aliases", "variables", "templates"}) {
        EXPECT_NE(doc->find(section), nullptr) << section;
    }

    ASSERT_EQ(run({"reset"}), ExitCodes::OK);
    ASSERT_TRUE(variables().empty());
    ASSERT_FALSE(aliases().find(std::nullopt, "ping").has_value());

    ASSERT_EQ(run({"import", bundle}), ExitCodes::OK);
    EXPECT_EQ(variables().at("host"), "example.com");
    EXPECT_TRUE(aliases().find(std::nullopt, "ping").has_value());
    EXPECT_TRUE(aliases().find(std::string("items"), "list").has_value());
}

TEST_F(CommandDispatcherTest, ExportSingleStore) {
    ASSERT_EQ(run({"setvar", "host", "example.com"}), ExitCodes::OK);

    const std::string file = (home_.path() / "vars.json").string();
    ASSERT_EQ(run({"export", "variables", file}), ExitCodes::OK);
    EXPECT_EQ(stores::read_json_file(file), json::Value::parse(R"({"host": "example.com"})"));

    EXPECT_EQ(run({"export", "everything", file}), ExitCodes::USAGE);
}

TEST_F(CommandDispatcherTest, ImportPicksStoreFromShape) {
    ASSERT_EQ(run({"import", write_file("aliases.json", R"({"ping": {"method": "GET", "url": "https://example.com/ping"}})")}), ExitCodes::OK);
    EXPECT_TRUE(aliases().find(std::nullopt, "ping").has_value());

    ASSERT_EQ(run({"import", write_file("collections.json", R"({"health": {"ping": {"method": "GET", "url": "https://example.com"}}})")}), ExitCodes::OK);
    EXPECT_TRUE(aliases().find(std::string("health"), "ping").has_value());

    ASSERT_EQ(run({"import", write_file("variables.json", R"({"token": "abc"})")}), ExitCodes::OK);
    EXPECT_EQ(variables().at("token"), "abc");

    EXPECT_EQ(run({"import", write_file("list.json", "[1, 2]")}), ExitCodes::FAILURE);
    EXPECT_EQ(run({"import", (home_.path() / "missing.json").string()}), ExitCodes::FAILURE);
}

TEST_F(CommandDispatcherTest, ResetAsksFirst) {
    ASSERT_EQ(run({"setvar", "host", "example.com"}), ExitCodes::OK);
    ASSERT_EQ(run({"debug", "on"}), ExitCodes::OK);

    prompter_.confirm_ = false;
    ASSERT_EQ(run({"reset"}), ExitCodes::OK);
    EXPECT_EQ(variables().size(), 1U);

    prompter_.confirm_ = true;
    ASSERT_EQ(run({"reset"}), ExitCodes::OK);
    EXPECT_TRUE(variables().empty());
    EXPECT_EQ(settings_.load_debug_mode(), DebugMode::OFF);
    EXPECT_EQ(stores::read_json_file(settings_.data_file(constants::HISTORY_FILE)), json::Value(json::Array{}));
}
