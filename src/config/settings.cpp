#include "settings.hpp"

#include <array>
#include <cstdlib>
#include <utility>

#include "../stores/json_file.hpp"
#include "../utils/constants.hpp"

namespace config {
    namespace {
        constexpr const char* DEBUG_MODE_KEY = "debug_mode";
    }  // namespace

    Settings::Settings(std::filesystem::path home) : home_(std::move(home)) {}

    Settings Settings::from_environment() {
        const char* home = std::getenv(constants::HOME_ENV_VAR);
        if (home == nullptr || *home == '\0') {
            return Settings(constants::DEFAULT_HOME);
        }
        return Settings(home);
    }

    std::filesystem::path Settings::data_dir() const { return home_ / constants::DATA_DIR; }

    std::filesystem::path Settings::scripts_dir() const { return home_ / constants::SCRIPTS_DIR; }

    std::filesystem::path Settings::data_file(const char* name) const { return data_dir() / name; }

    pipeline::model::DebugMode Settings::load_debug_mode() const {
        std::optional<json::Value> doc;
        try {
            doc = stores::read_json_file(data_file(constants::DEBUG_MODE_FILE));
        } catch (const std::runtime_error&) {
            return pipeline::model::DebugMode::OFF;
        }

        if (!doc) {
            return pipeline::model::DebugMode::OFF;
        }
        const json::Value* flag = doc->find(DEBUG_MODE_KEY);
        return flag != nullptr && flag->is_bool() && flag->as_bool() ? pipeline::model::DebugMode::ON : pipeline::model::DebugMode::OFF;
    }

    void Settings::save_debug_mode(pipeline::model::DebugMode mode) const {
        json::Value doc{json::Object{}};
        doc.set(DEBUG_MODE_KEY, mode == pipeline::model::DebugMode::ON);
        stores::write_json_file(data_file(constants::DEBUG_MODE_FILE), doc);
    }

    void Settings::reset_layout() const {
        static constexpr std::array<const char*, 6> DATA_FILES = {
            constants::COLLECTIONS_FILE,
            constants::HISTORY_FILE,
            constants::VARIABLES_FILE,
            constants::GLOBAL_ALIASES_FILE,
            constants::TEMPLATES_FILE,
            constants::DEBUG_MODE_FILE,
        };

        for (const char* name : DATA_FILES) {
            std::filesystem::remove(data_file(name));
        }
        ensure_layout();
    }

    void Settings::ensure_layout() const {
        std::filesystem::create_directories(data_dir());

        static constexpr std::array<const char*, 4> OBJECT_FILES = {
            constants::COLLECTIONS_FILE,
            constants::VARIABLES_FILE,
            constants::GLOBAL_ALIASES_FILE,
            constants::TEMPLATES_FILE,
        };

        for (const char* name : OBJECT_FILES) {
            const auto path = data_file(name);
            if (!std::filesystem::exists(path)) {
                stores::write_json_file(path, json::Value{json::Object{}});
            }
        }

        const auto history = data_file(constants::HISTORY_FILE);
        if (!std::filesystem::exists(history)) {
            stores::write_json_file(history, json::Value{json::Array{}});
        }

        if (!std::filesystem::exists(data_file(constants::DEBUG_MODE_FILE))) {
            save_debug_mode(pipeline::model::DebugMode::OFF);
        }
    }
}  // namespace config
