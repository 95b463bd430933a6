#include "pipeline_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pipeline::error {
    PipelineError::PipelineError(const std::string &msg) : std::runtime_error(msg) {}

    MissingVariable::MissingVariable(std::string name)
        : PipelineError("Variable '" + name + "' not found in saved variables."), name_(std::move(name)) {}

    MalformedAuth::MalformedAuth(const std::string &msg) : PipelineError(msg) {}

    UnsupportedAuthType::UnsupportedAuthType(std::string type)
        : PipelineError("Unsupported auth type '" + type + "'. Use 'bearer' or 'basic'."), type_(std::move(type)) {}

    OutputWriteError::OutputWriteError(std::string path,  // NOLINT(bugprone-easily-swappable-parameters)
                                       const std::string &msg)
        : PipelineError("Failed to write to output file '" + path + "': " + msg), path_(std::move(path)) {}

    InvalidAssertion::InvalidAssertion(std::string condition,  // NOLINT(bugprone-easily-swappable-parameters)
                                       const std::string &msg)
        : PipelineError("Invalid assertion '" + condition + "': " + msg), condition_(std::move(condition)) {}

    HistoryIOError::HistoryIOError(std::string path,  // NOLINT(bugprone-easily-swappable-parameters)
                                   const std::string &msg)
        : PipelineError("History file '" + path + "': " + msg), path_(std::move(path)) {}
}  // namespace pipeline::error
