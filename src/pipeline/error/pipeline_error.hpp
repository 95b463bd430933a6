#ifndef POST_MAKER_PIPELINE_ERROR_HPP
#define POST_MAKER_PIPELINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pipeline::error {
    struct PipelineError : public std::runtime_error {
        explicit PipelineError(const std::string &msg);
    };

    // Strict placeholder resolution met a {{name}} with no saved value.
    struct MissingVariable : public PipelineError {
        std::string name_;
        explicit MissingVariable(std::string name);
    };

    struct MalformedAuth : public PipelineError {
        explicit MalformedAuth(const std::string &msg);
    };

    struct UnsupportedAuthType : public PipelineError {
        std::string type_;
        explicit UnsupportedAuthType(std::string type);
    };

    struct OutputWriteError : public PipelineError {
        std::string path_;
        explicit OutputWriteError(std::string path, const std::string &msg);
    };

    struct InvalidAssertion : public PipelineError {
        std::string condition_;
        explicit InvalidAssertion(std::string condition, const std::string &msg);
    };

    struct HistoryIOError : public PipelineError {
        std::string path_;
        explicit HistoryIOError(std::string path, const std::string &msg);
    };
}  // namespace pipeline::error

#endif
