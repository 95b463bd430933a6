#include "commands.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <unordered_map>
#include <utility>

#include "../pipeline/error/pipeline_error.hpp"
#include "../stores/json_file.hpp"
#include "../utils/constants.hpp"
#include "../utils/diff_utils.hpp"
#include "../utils/string_utils.hpp"
#include "arguments.hpp"
#include "curl_command.hpp"

namespace cli {
    namespace {
        using pipeline::model::DebugMode;
        using pipeline::model::ExecuteOptions;
        using pipeline::model::RequestDescriptor;

        const std::vector<std::string> DISPLAY_FILTERS = {"body", "headers", "status"};

        constexpr std::size_t MAX_INDEX_DIGITS = 9;

        // Stores that export and import move as a whole, keyed by their section name.
        struct DataTarget {
            const char* name_;
            const char* file_;
        };

        constexpr std::array<DataTarget, 4> DATA_TARGETS = {{
            {"collections", constants::COLLECTIONS_FILE},
            {"aliases", constants::GLOBAL_ALIASES_FILE},
            {"variables", constants::VARIABLES_FILE},
            {"templates", constants::TEMPLATES_FILE},
        }};

        const FlagSpec METHOD_FLAG = {.short_ = "-m", .long_ = "--method", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid method"};
        const FlagSpec URL_FLAG = {.short_ = "-u", .long_ = "--url", .takes_value_ = true, .is_required_ = true, .allowed_values_ = {}, .error_message_ = "A URL is required (-u/--url)"};
        const FlagSpec HEADERS_FLAG = {.short_ = "-hd", .long_ = "--headers", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid headers"};
        const FlagSpec DATA_FLAG = {.short_ = "-d", .long_ = "--data", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid data"};
        const FlagSpec AUTH_FLAG = {.short_ = "", .long_ = "--auth", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid auth"};
        const FlagSpec ONLY_FLAG = {.short_ = "", .long_ = "--only", .takes_value_ = true, .is_required_ = false, .allowed_values_ = DISPLAY_FILTERS, .error_message_ = "Invalid --only"};
        const FlagSpec NO_HISTORY_FLAG = {.short_ = "-nh", .long_ = "--no-history", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""};
        const FlagSpec ALIAS_FLAG = {.short_ = "-a", .long_ = "--alias", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "An alias is required (-a/--alias)"};
        const FlagSpec COLLECTION_FLAG = {.short_ = "-c", .long_ = "--collection", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid collection"};
        const FlagSpec NAME_FLAG = {.short_ = "-n", .long_ = "--name", .takes_value_ = true, .is_required_ = true, .allowed_values_ = {}, .error_message_ = "A template name is required (-n/--name)"};

        // Everything that shapes one dispatch, shared by request, send and template save.
        const std::vector<FlagSpec> DISPATCH_FLAGS = {
            {.short_ = "-o", .long_ = "--output", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid output file"},
            ONLY_FLAG,
            AUTH_FLAG,
            {.short_ = "-as", .long_ = "--assert", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid assertion"},
            {.short_ = "-p", .long_ = "--preview", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            {.short_ = "-fv", .long_ = "--fillvars", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            {.short_ = "", .long_ = "--save-vars", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            NO_HISTORY_FLAG,
            {.short_ = "-dr", .long_ = "--dry-run", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            {.short_ = "-mk", .long_ = "--mock", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            {.short_ = "-r", .long_ = "--repeat", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid repeat"},
            {.short_ = "-i", .long_ = "--interval", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid interval"},
            {.short_ = "-v", .long_ = "--verbose", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
        };

        std::vector<FlagSpec> with_flags(std::vector<FlagSpec> base, const std::vector<FlagSpec>& extra) {
            base.insert(base.end(), extra.begin(), extra.end());
            return base;
        }

        FlagSpec required(FlagSpec spec) {
            spec.is_required_ = true;
            return spec;
        }

        std::vector<std::string> tail(const std::vector<std::string>& args, size_t from = 1) {
            if (args.size() <= from) {
                return {};
            }
            return {args.begin() + static_cast<std::ptrdiff_t>(from), args.end()};
        }

        // A JSON literal, or @path to read it from a file.
        json::Value json_argument(const std::string& text) {
            const std::string trimmed = string_utils::trim(text);
            if (!trimmed.starts_with("@")) {
                return json::Value::parse(trimmed);
            }

            const std::string path = trimmed.substr(1);
            auto doc = stores::read_json_file(path);
            if (!doc) {
                throw UsageError("File '" + path + "' is missing or empty");
            }
            return std::move(*doc);
        }

        RequestDescriptor descriptor_from_args(const ParsedArgs& parsed) {
            RequestDescriptor out;
            out.method_ = string_utils::to_upper(parsed.get_or("--method", "GET"));
            out.url_ = parsed.get_or("--url", "");
            if (const auto headers = parsed.get("--headers")) {
                const json::Value value = json_argument(*headers);
                if (!value.is_object()) {
                    throw UsageError("Headers must be a JSON object");
                }
                out.headers_ = pipeline::model::headers_from_json(value);
            }
            if (const auto data = parsed.get("--data")) {
                out.body_ = pipeline::model::normalize_body(json_argument(*data));
            }
            return out;
        }

        ExecuteOptions options_from_args(const ParsedArgs& parsed) {
            ExecuteOptions out;
            out.output_file_ = parsed.get("--output");
            if (const auto only = parsed.get("--only")) {
                out.display_filter_ = pipeline::model::parse_display_filter(*only);
            }
            out.auth_override_ = parsed.get("--auth");
            out.assertion_ = parsed.get("--assert");
            out.preview_ = parsed.has("--preview");
            out.fill_variables_ = parsed.has("--fillvars");
            out.skip_history_ = parsed.has("--no-history");
            out.dry_run_ = parsed.has("--dry-run");
            out.mock_ = parsed.has("--mock");
            const long repeat = parsed.get_long("--repeat", 1);
            if (repeat < std::numeric_limits<int>::min() || repeat > std::numeric_limits<int>::max()) {
                throw UsageError("Flag --repeat is out of range, got " + std::to_string(repeat));
            }
            out.repeat_ = static_cast<int>(repeat);
            out.interval_ms_ = parsed.get_long("--interval", 0);
            out.verbose_ = parsed.has("--verbose");
            return out;
        }

        std::optional<std::size_t> history_index(const std::string& text) {
            if (!string_utils::is_all_digits(text) || text.size() > MAX_INDEX_DIGITS) {
                return std::nullopt;
            }
            return std::stoul(text);
        }

        std::string join(const std::vector<std::string>& parts, size_t from) {
            std::string out;
            for (size_t i = from; i < parts.size(); ++i) {
                out += (i == from ? "" : " ") + parts[i];
            }
            return out;
        }
    }  // namespace

    CommandDispatcher::CommandDispatcher(config::Settings settings, ExecutorFactory executor_factory, renderers::IRenderer& renderer, prompts::IPrompter& prompter)
        : settings_(std::move(settings)),
          executor_factory_(std::move(executor_factory)),
          renderer_(renderer),
          prompter_(prompter),
          alias_store_(settings_.data_file(constants::COLLECTIONS_FILE), settings_.data_file(constants::GLOBAL_ALIASES_FILE)),
          template_store_(settings_.data_file(constants::TEMPLATES_FILE)),
          variable_store_(settings_.data_file(constants::VARIABLES_FILE)),
          history_store_(settings_.data_file(constants::HISTORY_FILE)) {}

    int CommandDispatcher::dispatch(const std::vector<std::string>& args) {
        static const std::unordered_map<std::string, Handler> HANDLERS = {
            {"request", &CommandDispatcher::cmd_request},         {"send", &CommandDispatcher::cmd_send},
            {"save", &CommandDispatcher::cmd_save},               {"history", &CommandDispatcher::cmd_history},
            {"replay", &CommandDispatcher::cmd_replay},           {"chain", &CommandDispatcher::cmd_chain},
            {"setvar", &CommandDispatcher::cmd_setvar},           {"vars", &CommandDispatcher::cmd_vars},
            {"debug", &CommandDispatcher::cmd_debug},             {"importcurl", &CommandDispatcher::cmd_importcurl},
            {"exportcurl", &CommandDispatcher::cmd_exportcurl},   {"template", &CommandDispatcher::cmd_template},
            {"collections", &CommandDispatcher::cmd_collections}, {"aliases", &CommandDispatcher::cmd_aliases},
            {"diff", &CommandDispatcher::cmd_diff},               {"export", &CommandDispatcher::cmd_export},
            {"import", &CommandDispatcher::cmd_import},           {"reset", &CommandDispatcher::cmd_reset},
            {"help", &CommandDispatcher::cmd_help},               {"version", &CommandDispatcher::cmd_version},
        };

        if (args.empty()) {
            return cmd_help(args);
        }

        auto it = HANDLERS.find(args.front());
        if (it == HANDLERS.end()) {
            renderer_.error("Unknown command '" + args.front() + "'. Type 'help' for the list of commands.");
            return ExitCodes::USAGE;
        }

        try {
            return (this->*(it->second))(args);
        } catch (const UsageError& e) {
            renderer_.error(e.what());
            return ExitCodes::USAGE;
        } catch (const pipeline::error::MissingVariable& e) {
            renderer_.error(std::string("Error: ") + e.what());
            return ExitCodes::MISSING_VARIABLE;
        } catch (const std::runtime_error& e) {
            renderer_.error(std::string("Error: ") + e.what());
            return ExitCodes::FAILURE;
        }
    }

    int CommandDispatcher::run_shell(std::istream& in, std::ostream& out) {
        const bool debug = settings_.load_debug_mode() == DebugMode::ON;
        renderer_.info(constants::BANNER_RULE);
        renderer_.info(std::string("PostMaker v") + constants::VERSION + " - a command line client for testing REST APIs");
        renderer_.info(std::string("Debug Mode: ") + (debug ? "ON" : "OFF"));
        renderer_.info("Type 'help' for the list of commands and 'exit' to leave.");
        renderer_.info(constants::BANNER_RULE);

        int last = ExitCodes::OK;
        std::string line;
        while (true) {
            out << "post_maker> " << std::flush;
            if (!std::getline(in, line)) {
                break;
            }

            std::vector<std::string> args;
            try {
                args = string_utils::shell_split(line);
            } catch (const std::runtime_error& e) {
                renderer_.error(e.what());
                last = ExitCodes::USAGE;
                continue;
            }

            if (args.empty()) {
                continue;
            }
            if (args.front() == "exit" || args.front() == "quit") {
                break;
            }
            last = dispatch(args);
        }
        return last;
    }

    int CommandDispatcher::execute(const RequestDescriptor& descriptor, const ExecuteOptions& options, bool save_prompted) {
        auto executor = executor_factory_(settings_.load_debug_mode());
        return finish(executor->execute(descriptor, options), save_prompted);
    }

    int CommandDispatcher::finish(const pipeline::model::ExecutionSummary& summary, bool save_prompted) {
        if (save_prompted && !summary.prompted_variables_.empty()) {
            auto variables = variable_store_.load();
            for (const auto& [name, value] : summary.prompted_variables_) {
                variables[name] = value;
            }
            variable_store_.save(variables);
            renderer_.success("Saved " + std::to_string(summary.prompted_variables_.size()) + " variable(s).");
        }
        return summary.failed_ > 0 ? ExitCodes::FAILURE : ExitCodes::OK;
    }

    void CommandDispatcher::render_descriptor(const std::string& alias, const RequestDescriptor& descriptor) {
        renderer_.info("  Alias: " + alias);
        renderer_.info("    Method: " + descriptor.method_);
        renderer_.info("    URL: " + descriptor.url_);
        renderer_.info("    Headers: " + pipeline::model::headers_to_json(descriptor.headers_).dump());
        renderer_.info("    Data: " + (descriptor.body_ ? descriptor.body_->dump() : std::string("null")));
        if (descriptor.auth_) {
            renderer_.info("    Auth: " + *descriptor.auth_);
        }
    }

    int CommandDispatcher::cmd_request(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = with_flags({METHOD_FLAG, URL_FLAG, HEADERS_FLAG, DATA_FLAG}, DISPATCH_FLAGS);

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        return execute(descriptor_from_args(parsed), options_from_args(parsed), parsed.has("--save-vars"));
    }

    int CommandDispatcher::cmd_send(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = with_flags({required(ALIAS_FLAG), COLLECTION_FLAG}, DISPATCH_FLAGS);

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        const std::string alias = *parsed.get("--alias");
        const std::optional<std::string> collection = parsed.get("--collection");

        const auto descriptor = alias_store_.find(collection, alias);
        if (!descriptor) {
            if (collection) {
                renderer_.error("Alias '" + alias + "' not found in collection '" + *collection + "'.");
            } else {
                renderer_.error("Alias '" + alias + "' not found in global aliases. Did you mean to specify a collection with -c <collection>?");
            }
            return ExitCodes::FAILURE;
        }

        return execute(*descriptor, options_from_args(parsed), parsed.has("--save-vars"));
    }

    int CommandDispatcher::cmd_save(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {required(ALIAS_FLAG), COLLECTION_FLAG, METHOD_FLAG, URL_FLAG, HEADERS_FLAG, DATA_FLAG, AUTH_FLAG};

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        RequestDescriptor descriptor = descriptor_from_args(parsed);
        descriptor.auth_ = parsed.get("--auth");

        const std::string alias = *parsed.get("--alias");
        const std::optional<std::string> collection = parsed.get("--collection");
        alias_store_.save(collection, alias, descriptor);

        if (collection) {
            renderer_.success("Request saved as '" + alias + "' in collection '" + *collection + "'.");
        } else {
            renderer_.success("Request saved as global alias '" + alias + "'.");
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_history(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {
            {.short_ = "-cl", .long_ = "--clear", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
            {.short_ = "-n", .long_ = "--number", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid number"},
            {.short_ = "-s", .long_ = "--search", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid search"},
        };

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);

        if (parsed.has("--clear")) {
            if (!prompter_.confirm("Are you sure you want to clear all history?")) {
                renderer_.warning("Cancelled.");
                return ExitCodes::OK;
            }
            history_store_.clear();
            renderer_.success("History cleared.");
            return ExitCodes::OK;
        }

        const long number = parsed.get_long("--number", 0);
        const std::optional<std::size_t> last_n = number > 0 ? std::optional<std::size_t>(static_cast<std::size_t>(number)) : std::nullopt;
        renderer_.render_history(stores::filter_history(history_store_.load_all(), parsed.get("--search"), last_n));
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_replay(const std::vector<std::string>& args) {
        const auto index = args.size() == 2 ? history_index(args[1]) : std::nullopt;
        if (!index) {
            throw UsageError("Usage: replay <history index>");
        }

        const auto record = history_store_.at(*index);
        if (!record) {
            renderer_.error("Invalid history index.");
            return ExitCodes::FAILURE;
        }

        auto executor = executor_factory_(settings_.load_debug_mode());
        return finish(executor->replay(*record), false);
    }

    int CommandDispatcher::cmd_chain(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            throw UsageError("Usage: chain <filename>");
        }

        const auto doc = stores::read_json_file(args[1]);
        if (!doc) {
            renderer_.error("Chain file '" + args[1] + "' is missing or empty.");
            return ExitCodes::FAILURE;
        }

        auto executor = executor_factory_(settings_.load_debug_mode());
        return finish(executor->run_chain(pipeline::executor::chain_from_json(*doc)), false);
    }

    int CommandDispatcher::cmd_setvar(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            throw UsageError("Usage: setvar <key> <value>");
        }

        variable_store_.set(args[1], join(args, 2));
        renderer_.success("Variable '" + args[1] + "' set.");
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_vars(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {
            {.short_ = "-rm", .long_ = "--remove", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid key"},
            {.short_ = "-cl", .long_ = "--clear", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
        };

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        const auto variables = variable_store_.load();

        if (parsed.has("--clear")) {
            if (variables.empty()) {
                renderer_.warning("No variables to clear.");
            } else if (prompter_.confirm("Are you sure you want to clear all variables?")) {
                variable_store_.clear();
                renderer_.success("All variables cleared.");
            } else {
                renderer_.warning("Cancelled.");
            }
            return ExitCodes::OK;
        }

        if (const auto name = parsed.get("--remove")) {
            if (!variables.contains(*name)) {
                renderer_.warning("Variable '" + *name + "' not found.");
            } else if (prompter_.confirm("Remove variable '" + *name + "'?")) {
                (void)variable_store_.remove(*name);
                renderer_.success("Variable '" + *name + "' removed.");
            } else {
                renderer_.warning("Cancelled.");
            }
            return ExitCodes::OK;
        }

        json::Value doc{json::Object{}};
        for (const auto& [name, value] : variables) {
            doc.set(name, value);
        }
        renderer_.info(doc.dump(constants::JSON_INDENT));
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_debug(const std::vector<std::string>& args) {
        DebugMode mode = settings_.load_debug_mode();

        const std::string action = args.size() > 1 ? string_utils::to_lower(args[1]) : "";
        if (action == "on") {
            mode = DebugMode::ON;
        } else if (action == "off") {
            mode = DebugMode::OFF;
        } else if (action == "toggle") {
            mode = mode == DebugMode::ON ? DebugMode::OFF : DebugMode::ON;
        } else if (!action.empty()) {
            throw UsageError("Usage: debug [on|off|toggle]");
        }

        if (!action.empty()) {
            settings_.save_debug_mode(mode);
        }

        if (mode == DebugMode::ON) {
            renderer_.warning("Debug mode is ON");
        } else {
            renderer_.success("Debug mode is OFF");
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_importcurl(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {required(ALIAS_FLAG), COLLECTION_FLAG};

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        if (parsed.positional().size() != 1) {
            throw UsageError("Usage: importcurl \"<curl command>\" -a <alias> [-c <collection>]");
        }

        const RequestDescriptor descriptor = parse_curl_command(parsed.positional().front());
        const std::string alias = *parsed.get("--alias");
        const std::optional<std::string> collection = parsed.get("--collection");
        alias_store_.save(collection, alias, descriptor);

        if (collection) {
            renderer_.success("Imported cURL as '" + alias + "' in collection '" + *collection + "'.");
        } else {
            renderer_.success("Imported cURL as global alias '" + alias + "'.");
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_exportcurl(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {required(ALIAS_FLAG), COLLECTION_FLAG};

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);
        const std::string alias = *parsed.get("--alias");

        const auto descriptor = alias_store_.find(parsed.get("--collection"), alias);
        if (!descriptor) {
            renderer_.error("Alias '" + alias + "' not found.");
            return ExitCodes::FAILURE;
        }

        renderer_.info(to_curl_command(*descriptor));
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_template(const std::vector<std::string>& args) {
        const std::string sub = args.size() > 1 ? args[1] : "";

        if (sub == "save") {
            static const std::vector<FlagSpec> FLAGS =
                with_flags({NAME_FLAG, required(METHOD_FLAG), URL_FLAG, HEADERS_FLAG, DATA_FLAG}, DISPATCH_FLAGS);

            const ParsedArgs parsed = parse_arguments(tail(args, 2), FLAGS);
            const stores::RequestTemplate request_template{
                .name_ = *parsed.get("--name"),
                .descriptor_ = descriptor_from_args(parsed),
                .flags_ = options_from_args(parsed),
            };
            template_store_.save(request_template);
            renderer_.success("Template '" + request_template.name_ + "' saved with all details.");
            return ExitCodes::OK;
        }

        if (sub == "list") {
            const auto templates = template_store_.list();
            if (templates.empty()) {
                renderer_.warning("No templates saved.");
            }
            for (const auto& t : templates) {
                renderer_.info("Template: " + t.name_);
                render_descriptor(t.name_, t.descriptor_);
                renderer_.info("    Flags: " + pipeline::model::to_json(t.flags_).dump());
            }
            return ExitCodes::OK;
        }

        if (sub == "use") {
            static const std::vector<FlagSpec> FLAGS = {AUTH_FLAG, ONLY_FLAG, NO_HISTORY_FLAG};

            const ParsedArgs parsed = parse_arguments(tail(args, 2), FLAGS);
            if (parsed.positional().size() != 1) {
                throw UsageError("Usage: template use <name> [--auth ...] [--only body|headers|status] [-nh]");
            }

            const std::string& name = parsed.positional().front();
            const auto found = template_store_.find(name);
            if (!found) {
                renderer_.warning("Template '" + name + "' not found.");
                return ExitCodes::FAILURE;
            }

            ExecuteOptions options = found->flags_;
            if (const auto auth = parsed.get("--auth")) {
                options.auth_override_ = auth;
            }
            if (const auto only = parsed.get("--only")) {
                options.display_filter_ = pipeline::model::parse_display_filter(*only);
            }
            if (parsed.has("--no-history")) {
                options.skip_history_ = true;
            }

            renderer_.render_preview(renderers::RequestPreview{
                .method_ = found->descriptor_.method_,
                .url_ = found->descriptor_.url_,
                .headers_ = found->descriptor_.headers_,
                .body_ = pipeline::model::normalize_body(found->descriptor_.body_),
            });
            if (!prompter_.confirm("Send this request?")) {
                renderer_.warning("Cancelled.");
                return ExitCodes::OK;
            }
            return execute(found->descriptor_, options, false);
        }

        if (sub == "delete") {
            static const std::vector<FlagSpec> FLAGS = {NAME_FLAG};

            const ParsedArgs parsed = parse_arguments(tail(args, 2), FLAGS);
            const std::string name = *parsed.get("--name");
            if (!template_store_.remove(name)) {
                renderer_.warning("Template '" + name + "' not found.");
                return ExitCodes::FAILURE;
            }
            renderer_.success("Template '" + name + "' deleted.");
            return ExitCodes::OK;
        }

        throw UsageError("Usage: template save|list|use|delete ...");
    }

    int CommandDispatcher::cmd_collections(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {
            COLLECTION_FLAG,
            ALIAS_FLAG,
            {.short_ = "-del", .long_ = "--delete", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid target"},
            {.short_ = "-rm", .long_ = "--remove", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid target"},
        };

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);

        const auto remove_item = [this](const std::string& collection, const std::string& alias) {
            if (!prompter_.confirm("Delete alias '" + alias + "' from collection '" + collection + "'?")) {
                renderer_.warning("Cancelled.");
            } else if (alias_store_.delete_collection_item(collection, alias)) {
                renderer_.success("Alias '" + alias + "' deleted from collection '" + collection + "'.");
            } else {
                renderer_.warning("Alias '" + alias + "' not found in collection '" + collection + "'.");
            }
            return ExitCodes::OK;
        };

        if (const auto target = parsed.get("--remove")) {
            const auto colon = target->find(':');
            if (colon == std::string::npos) {
                throw UsageError("Format for --remove is collection:alias");
            }
            return remove_item(target->substr(0, colon), target->substr(colon + 1));
        }

        if (const auto target = parsed.get("--delete")) {
            const auto colon = target->find(':');
            if (colon != std::string::npos) {
                return remove_item(target->substr(0, colon), target->substr(colon + 1));
            }
            if (!prompter_.confirm("Delete collection '" + *target + "'?")) {
                renderer_.warning("Cancelled.");
            } else if (alias_store_.delete_collection(*target)) {
                renderer_.success("Collection '" + *target + "' deleted.");
            } else {
                renderer_.warning("Collection '" + *target + "' not found.");
            }
            return ExitCodes::OK;
        }

        const auto collection_filter = parsed.get("--collection");
        const auto alias_filter = parsed.get("--alias");

        const auto collections = alias_store_.collections();
        if (collections.empty()) {
            renderer_.warning("No collections saved.");
            return ExitCodes::OK;
        }

        bool shown = false;
        for (const auto& collection : collections) {
            if (collection_filter && collection.name_ != *collection_filter) {
                continue;
            }
            renderer_.info("Collection: " + collection.name_);
            for (const auto& [alias, descriptor] : collection.aliases_) {
                if (alias_filter && alias != *alias_filter) {
                    continue;
                }
                render_descriptor(alias, descriptor);
                shown = true;
            }
        }

        if (collection_filter && !shown) {
            renderer_.error(alias_filter ? "Alias '" + *alias_filter + "' not found in collection '" + *collection_filter + "'."
                                         : "Collection '" + *collection_filter + "' not found.");
            return ExitCodes::FAILURE;
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_aliases(const std::vector<std::string>& args) {
        static const std::vector<FlagSpec> FLAGS = {
            ALIAS_FLAG,
            {.short_ = "-rm", .long_ = "--remove", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = "Invalid alias"},
        };

        const ParsedArgs parsed = parse_arguments(tail(args), FLAGS);

        if (const auto alias = parsed.get("--remove")) {
            if (!alias_store_.find(std::nullopt, *alias)) {
                renderer_.warning("Global alias '" + *alias + "' not found.");
            } else if (prompter_.confirm("Remove global alias '" + *alias + "'?")) {
                (void)alias_store_.remove_global(*alias);
                renderer_.success("Global alias '" + *alias + "' removed.");
            } else {
                renderer_.warning("Cancelled.");
            }
            return ExitCodes::OK;
        }

        const auto aliases = alias_store_.global_aliases();
        if (aliases.empty()) {
            renderer_.warning("No global aliases saved.");
            return ExitCodes::OK;
        }

        const auto alias_filter = parsed.get("--alias");
        bool shown = false;
        renderer_.info("Global Aliases:");
        for (const auto& [alias, descriptor] : aliases) {
            if (alias_filter && alias != *alias_filter) {
                continue;
            }
            render_descriptor(alias, descriptor);
            shown = true;
        }

        if (alias_filter && !shown) {
            renderer_.warning("Alias '" + *alias_filter + "' not found in global aliases.");
            return ExitCodes::FAILURE;
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_diff(const std::vector<std::string>& args) {
        if (args.size() != 3) {
            throw UsageError("Usage: diff <history index> <history index> | diff <file> <file>");
        }

        std::vector<std::string> lines;
        if (string_utils::is_all_digits(args[1]) && string_utils::is_all_digits(args[2])) {
            const auto records = history_store_.load_all();
            const auto first = history_index(args[1]);
            const auto second = history_index(args[2]);
            if (!first || !second || *first >= records.size() || *second >= records.size()) {
                renderer_.error("Invalid history indexes.");
                return ExitCodes::FAILURE;
            }
            lines = diff_utils::unified_diff(string_utils::split_lines(records[*first].response_body_),
                                             string_utils::split_lines(records[*second].response_body_),
                                             "history[" + std::to_string(*first) + "]",
                                             "history[" + std::to_string(*second) + "]");
        } else {
            const auto before = stores::read_text_file(args[1]);
            const auto after = stores::read_text_file(args[2]);
            if (!before || !after) {
                renderer_.error("Files not found or invalid arguments.");
                return ExitCodes::FAILURE;
            }
            lines = diff_utils::unified_diff(string_utils::split_lines(*before), string_utils::split_lines(*after), args[1], args[2]);
        }

        if (lines.empty()) {
            renderer_.info("No differences.");
        }
        for (const auto& line : lines) {
            if (line.starts_with('+') && !line.starts_with("+++")) {
                renderer_.success(line);
            } else if (line.starts_with('-') && !line.starts_with("---")) {
                renderer_.error(line);
            } else {
                renderer_.info(line);
            }
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_export(const std::vector<std::string>& args) {
        if (args.size() != 3) {
            throw UsageError("Usage: export all|collections|aliases|variables|templates <file>");
        }

        const auto load = [this](const DataTarget& source) {
            auto doc = stores::read_json_file(settings_.data_file(source.file_));
            return doc ? std::move(*doc) : json::Value{json::Object{}};
        };

        const std::string& target = args[1];
        json::Value out{json::Object{}};
        if (target == "all") {
            for (const auto& t : DATA_TARGETS) {
                out.set(t.name_, load(t));
            }
        } else {
            const auto it = std::find_if(DATA_TARGETS.begin(), DATA_TARGETS.end(), [&target](const DataTarget& t) { return target == t.name_; });
            if (it == DATA_TARGETS.end()) {
                throw UsageError("Unknown export target: " + target);
            }
            out = load(*it);
        }

        stores::write_json_file(args[2], out);
        renderer_.success("Exported " + target + " to " + args[2]);
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_import(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            throw UsageError("Usage: import <file>");
        }

        const auto doc = stores::read_json_file(args[1]);
        if (!doc) {
            renderer_.error("File '" + args[1] + "' not found.");
            return ExitCodes::FAILURE;
        }
        if (doc->is_array()) {
            renderer_.error("Importing lists is not supported.");
            return ExitCodes::FAILURE;
        }
        if (!doc->is_object()) {
            renderer_.error("Unknown data format for import.");
            return ExitCodes::FAILURE;
        }

        const auto store = [this](const char* file, const json::Value& value) { stores::write_json_file(settings_.data_file(file), value); };

        // A bundle written by "export all" carries one section per store.
        const bool bundle = std::any_of(DATA_TARGETS.begin(), DATA_TARGETS.end(), [&doc](const DataTarget& t) { return doc->find(t.name_) != nullptr; });
        if (bundle) {
            for (const auto& t : DATA_TARGETS) {
                const json::Value* section = doc->find(t.name_);
                if (section != nullptr && !section->is_object()) {
                    throw std::runtime_error("Section '" + std::string(t.name_) + "' must be a JSON object");
                }
            }
            for (const auto& t : DATA_TARGETS) {
                if (const json::Value* section = doc->find(t.name_)) {
                    store(t.file_, *section);
                }
            }
            renderer_.success("Imported all data from " + args[1]);
            return ExitCodes::OK;
        }

        // Otherwise the shape tells the store: {alias: {method, url}} is aliases, other nested objects are collections.
        const auto& members = doc->as_object();
        const bool nested = std::all_of(members.begin(), members.end(), [](const auto& member) { return member.second.is_object(); });
        if (!nested) {
            store(constants::VARIABLES_FILE, *doc);
            renderer_.success("Imported variables from " + args[1]);
            return ExitCodes::OK;
        }

        const bool requests = std::all_of(members.begin(), members.end(), [](const auto& member) {
            return member.second.find("method") != nullptr && member.second.find("url") != nullptr;
        });
        if (requests) {
            store(constants::GLOBAL_ALIASES_FILE, *doc);
            renderer_.success("Imported aliases from " + args[1]);
        } else {
            store(constants::COLLECTIONS_FILE, *doc);
            renderer_.success("Imported collections from " + args[1]);
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_reset(const std::vector<std::string>& /*args*/) {
        if (!prompter_.confirm("Are you sure you want to reset all data files? This will delete all saved data.")) {
            renderer_.warning("Reset cancelled.");
            return ExitCodes::OK;
        }

        settings_.reset_layout();
        renderer_.success("All data files have been reset.");
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_help(const std::vector<std::string>& /*args*/) {
        static const std::vector<std::pair<const char*, const char*>> COMMANDS = {
            {"request", "Make an HTTP request: request -u URL [-m METHOD] [-hd JSON|@file] [-d JSON|@file] [-o FILE] [--only body|headers|status]"},
            {"send", "Send a saved request: send -a ALIAS [-c COLLECTION] [dispatch flags]"},
            {"save", "Save a request: save -a ALIAS -u URL [-c COLLECTION] [-m METHOD] [-hd JSON] [-d JSON] [--auth ...]"},
            {"history", "View or clear request history: history [-n N] [-s TEXT] [-cl]"},
            {"replay", "Replay a request from history: replay INDEX"},
            {"chain", "Run a chain of requests from a JSON file: chain FILE"},
            {"setvar", "Set a variable for {{name}} placeholders: setvar KEY VALUE"},
            {"vars", "View, remove or clear variables: vars [-rm KEY] [-cl]"},
            {"debug", "Show or change debug mode: debug [on|off|toggle]"},
            {"importcurl", "Import a cURL command: importcurl \"curl ...\" -a ALIAS [-c COLLECTION]"},
            {"exportcurl", "Export a saved request as cURL: exportcurl -a ALIAS [-c COLLECTION]"},
            {"template", "Manage templates: template save|list|use|delete"},
            {"collections", "List or delete collections: collections [-c NAME] [-a ALIAS] [-del NAME[:ALIAS]] [-rm NAME:ALIAS]"},
            {"aliases", "List or remove global aliases: aliases [-a ALIAS] [-rm ALIAS]"},
            {"diff", "Diff two history response bodies or two files: diff INDEX INDEX | diff FILE FILE"},
            {"export", "Export stores to a JSON file: export all|collections|aliases|variables|templates FILE"},
            {"import", "Import stores from a JSON file written by export: import FILE"},
            {"reset", "Delete and recreate every data file"},
            {"version", "Print the version"},
        };

        static const std::vector<std::pair<const char*, const char*>> DISPATCH_HELP = {
            {"--auth", "\"bearer TOKEN\" or \"basic USER:PASS\""},
            {"-as/--assert", "status=N or body_contains=TEXT, optionally followed by ,SCRIPT (1-5)"},
            {"-p/--preview", "Show the request and ask before sending"},
            {"-fv/--fillvars", "Prompt for unknown {{variables}}; add --save-vars to keep the answers"},
            {"-dr/--dry-run", "[DEBUG] Show what would be sent without sending it"},
            {"-mk/--mock", "[DEBUG] Return a fake response instead of sending"},
            {"-r/--repeat, -i/--interval", "[DEBUG] Send N times, waiting the given milliseconds between sends"},
            {"-v/--verbose", "[DEBUG] Print the full request and response"},
            {"-nh/--no-history", "[DEBUG] Do not record this request in history"},
        };

        renderer_.info("Commands:");
        for (const auto& [name, text] : COMMANDS) {
            renderer_.info(std::string("  ") + name + " - " + text);
        }
        renderer_.info("Dispatch flags:");
        for (const auto& [name, text] : DISPATCH_HELP) {
            renderer_.info(std::string("  ") + name + ": " + text);
        }
        return ExitCodes::OK;
    }

    int CommandDispatcher::cmd_version(const std::vector<std::string>& /*args*/) {
        renderer_.info(std::string("PostMaker v") + constants::VERSION);
        return ExitCodes::OK;
    }
}  // namespace cli
