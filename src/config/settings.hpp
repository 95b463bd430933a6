#ifndef POST_MAKER_SETTINGS_HPP
#define POST_MAKER_SETTINGS_HPP

#include <filesystem>

#include "../http/client/curl_easy.hpp"
#include "../pipeline/model/model.hpp"

namespace config {
    /**
     * Where PostMaker keeps its files and how it talks to the network.
     *
     * The home directory comes from POST_MAKER_HOME and defaults to the working directory.
     * Data files live in <home>/data and user scripts in <home>/scripts.
     */
    class Settings {
       public:
        explicit Settings(std::filesystem::path home);

        static Settings from_environment();

        [[nodiscard]] const std::filesystem::path& get_home() const { return home_; }
        [[nodiscard]] std::filesystem::path data_dir() const;
        [[nodiscard]] std::filesystem::path scripts_dir() const;
        [[nodiscard]] std::filesystem::path data_file(const char* name) const;

        [[nodiscard]] const http::client::CurlOptions& get_curl_options() const { return curl_options_; }

        // A missing or unreadable flag file means debug mode is off.
        [[nodiscard]] pipeline::model::DebugMode load_debug_mode() const;
        void save_debug_mode(pipeline::model::DebugMode mode) const;

        // Creates the data directory with empty stores ([] for history, {} otherwise). Existing files are kept.
        void ensure_layout() const;

        // Deletes every data file, debug flag included, then lays them out again empty.
        void reset_layout() const;

       private:
        std::filesystem::path home_;
        http::client::CurlOptions curl_options_;
    };
}  // namespace config

#endif
