#ifndef POST_MAKER_CONSTANTS_HPP
#define POST_MAKER_CONSTANTS_HPP

#include <array>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int JSON_INDENT = 2;

    inline constexpr const char* VERSION = "1.0.2";
    inline constexpr const char* HOME_ENV_VAR = "POST_MAKER_HOME";
    inline constexpr const char* DEFAULT_HOME = ".";
    inline constexpr const char* DATA_DIR = "data";
    inline constexpr const char* SCRIPTS_DIR = "scripts";

    inline constexpr const char* COLLECTIONS_FILE = "collections.json";
    inline constexpr const char* HISTORY_FILE = "history.json";
    inline constexpr const char* VARIABLES_FILE = "variables.json";
    inline constexpr const char* GLOBAL_ALIASES_FILE = "global_aliases.json";
    inline constexpr const char* TEMPLATES_FILE = "templates.json";
    inline constexpr const char* DEBUG_MODE_FILE = "debug_mode.json";

    inline constexpr int MIN_SCRIPT_ID = 1;
    inline constexpr int MAX_SCRIPT_ID = 5;

    inline constexpr std::array<long, 5> MOCK_STATUS_CODES = {200, 201, 400, 404, 500};
    inline constexpr double MOCK_MIN_ELAPSED_MS = 10.0;
    inline constexpr double MOCK_MAX_ELAPSED_MS = 100.0;

    inline constexpr const char* REPORT_SEPARATOR = "============================";
    inline constexpr const char* BANNER_RULE = "============================================================";
}  // namespace constants

#endif
