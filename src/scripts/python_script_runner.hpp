#ifndef POST_MAKER_PYTHON_SCRIPT_RUNNER_HPP
#define POST_MAKER_PYTHON_SCRIPT_RUNNER_HPP

#include <filesystem>

#include "interface.hpp"

namespace scripts {
    /**
     * Runs <scripts_dir>/<id>.py inside the process-wide embedded interpreter.
     * Each run gets a fresh global scope, so scripts cannot see each other's state.
     */
    class PythonScriptRunner : public IScriptRunner {
       public:
        explicit PythonScriptRunner(std::filesystem::path scripts_dir);

        bool run(int script_id) override;

        // Writes placeholder scripts for every missing id. Existing scripts are left alone.
        void ensure_default_scripts() const;

        [[nodiscard]] std::filesystem::path script_path(int script_id) const;

       private:
        std::filesystem::path scripts_dir_;
    };
}  // namespace scripts

#endif
