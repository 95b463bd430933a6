#include "assertion.hpp"

#include <charconv>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/pipeline_error.hpp"

namespace pipeline::assertions {
    Assertion parse_assertion(std::string_view text) {
        Assertion out;

        std::string_view cond = text;
        if (const auto comma = text.find(','); comma != std::string_view::npos) {
            cond = text.substr(0, comma);
            out.script_ = string_utils::trim(std::string(text.substr(comma + 1)));
        }
        out.condition_ = std::string(cond);

        const auto eq = cond.find('=');
        if (eq == std::string_view::npos) {
            throw error::InvalidAssertion(std::string(text), "expected kind=value");
        }

        const std::string_view kind = cond.substr(0, eq);
        out.expected_ = std::string(cond.substr(eq + 1));

        if (kind == AssertionKeys::STATUS) {
            out.kind_ = AssertionKind::STATUS;
            const std::string digits = string_utils::trim(out.expected_);
            long status = 0;
            auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), status, constants::BASE_10);
            if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size()) {
                throw error::InvalidAssertion(std::string(text), "status must be an integer");
            }
            out.expected_status_ = status;
        } else if (kind == AssertionKeys::BODY_CONTAINS) {
            out.kind_ = AssertionKind::BODY_CONTAINS;
        }

        return out;
    }

    bool check(const Assertion& assertion, const pipeline::model::ResponseRecord& record) {
        switch (assertion.kind_) {
            case AssertionKind::STATUS:
                return record.status_ == assertion.expected_status_;
            case AssertionKind::BODY_CONTAINS:
                return record.response_body_.find(assertion.expected_) != std::string::npos;
            case AssertionKind::UNKNOWN:
                return false;
        }
        return false;
    }

    std::optional<int> runnable_script_id(const Assertion& assertion) {
        if (!assertion.script_ || !string_utils::is_all_digits(*assertion.script_)) {
            return std::nullopt;
        }
        const std::string& digits = *assertion.script_;
        int id = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id, constants::BASE_10);
        if (ec != std::errc{} || id < constants::MIN_SCRIPT_ID || id > constants::MAX_SCRIPT_ID) {
            return std::nullopt;
        }
        return id;
    }

    AssertionEvaluator::AssertionEvaluator(renderers::IRenderer* renderer, scripts::IScriptRunner* script_runner)
        : renderer_(renderer), script_runner_(script_runner) {}

    bool AssertionEvaluator::evaluate(std::string_view condition, const pipeline::model::ResponseRecord& record) const {
        const Assertion assertion = parse_assertion(condition);
        const bool passed = check(assertion, record);

        switch (assertion.kind_) {
            case AssertionKind::STATUS:
                if (passed) {
                    renderer_->success("Assertion passed: status=" + std::to_string(assertion.expected_status_));
                } else {
                    renderer_->error("Assertion failed: status=" + std::to_string(record.status_) + " (expected " +
                                     std::to_string(assertion.expected_status_) + ")");
                }
                break;
            case AssertionKind::BODY_CONTAINS:
                if (passed) {
                    renderer_->success("Assertion passed: body contains '" + assertion.expected_ + "'");
                } else {
                    renderer_->error("Assertion failed: body does not contain '" + assertion.expected_ + "'");
                }
                break;
            case AssertionKind::UNKNOWN:
                renderer_->warning("Unrecognized assertion '" + assertion.condition_ + "', expected status=N or body_contains=TEXT");
                break;
        }

        if (!passed) {
            return false;
        }

        const std::optional<int> script_id = runnable_script_id(assertion);
        if (!script_id) {
            if (assertion.script_ && !assertion.script_->empty()) {
                renderer_->warning("Ignoring script '" + *assertion.script_ + "', expected a number from 1 to 5");
            }
            return true;
        }

        if (!script_runner_->run(*script_id)) {
            renderer_->error("Script " + std::to_string(*script_id) + " not found.");
        }

        return true;
    }
}  // namespace pipeline::assertions
