#ifndef POST_MAKER_ASSERTION_HPP
#define POST_MAKER_ASSERTION_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../../renderers/interface.hpp"
#include "../../scripts/interface.hpp"
#include "../model/model.hpp"

namespace pipeline::assertions {
    enum class AssertionKind { STATUS, BODY_CONTAINS, UNKNOWN };

    struct AssertionKeys {
        static constexpr const char* STATUS = "status";
        static constexpr const char* BODY_CONTAINS = "body_contains";
    };

    struct Assertion {
        AssertionKind kind_ = AssertionKind::UNKNOWN;
        std::string condition_;
        std::string expected_;
        long expected_status_ = 0;
        // Raw text after the comma, if any. Only all-digit ids in [1, 5] are run.
        std::optional<std::string> script_;
    };

    // Parses "cond[,script]". Throws error::InvalidAssertion for a condition without '=' or a non-numeric status.
    [[nodiscard]] Assertion parse_assertion(std::string_view text);

    [[nodiscard]] bool check(const Assertion& assertion, const pipeline::model::ResponseRecord& record);

    [[nodiscard]] std::optional<int> runnable_script_id(const Assertion& assertion);

    class AssertionEvaluator {
       public:
        AssertionEvaluator(renderers::IRenderer* renderer, scripts::IScriptRunner* script_runner);

        // Reports the outcome and, on pass, runs the accompanying script. A missing script is reported
        // without changing the result.
        bool evaluate(std::string_view condition, const pipeline::model::ResponseRecord& record) const;

       private:
        renderers::IRenderer* renderer_;
        scripts::IScriptRunner* script_runner_;
    };
}  // namespace pipeline::assertions

#endif
