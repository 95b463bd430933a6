#ifndef POST_MAKER_SCRIPTS_INTERFACE_HPP
#define POST_MAKER_SCRIPTS_INTERFACE_HPP

namespace scripts {
    class IScriptRunner {
       public:
        IScriptRunner() = default;
        virtual ~IScriptRunner() = default;
        IScriptRunner(const IScriptRunner&) = delete;
        IScriptRunner& operator=(const IScriptRunner&) = delete;
        IScriptRunner(IScriptRunner&&) = delete;
        IScriptRunner& operator=(IScriptRunner&&) = delete;

        // Runs the numbered script synchronously. Returns false when no such script exists.
        virtual bool run(int script_id) = 0;
    };
}  // namespace scripts

#endif
