#pragma once

#include <exception>
#include <string>
#include <vector>
#include <optional>

namespace maskalloc {

/// Base exception for all maskalloc errors
class MaskAllocError : public std::exception {
public:
    explicit MaskAllocError(std::string message)
        : message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

protected:
    std::string message_;
};

/// Raised when a pruning round is misconfigured or a collaborator broke its contract.
/// Fatal to the current round: no partial mask set is produced.
class ConfigError : public MaskAllocError {
public:
    explicit ConfigError(const std::string& message,
                         std::optional<std::string> layer = std::nullopt)
        : MaskAllocError(layer.has_value()
            ? "[" + layer.value() + "] " + message
            : message)
        , layer_(std::move(layer)) {}

    const std::optional<std::string>& layer() const { return layer_; }

private:
    std::optional<std::string> layer_;
};

/// Raised when a metric or mask shape doesn't match the configured granularity
class ShapeMismatchError : public MaskAllocError {
public:
    ShapeMismatchError(const std::string& name,
                       const std::string& expected,
                       const std::string& got)
        : MaskAllocError("Shape mismatch for '" + name +
                         "': expected " + expected + ", got " + got)
        , name_(name) {}

    const std::string& tensor_name() const { return name_; }

private:
    std::string name_;
};

/// Raised when graph validation fails
class ValidationError : public MaskAllocError {
public:
    explicit ValidationError(const std::vector<std::string>& errors)
        : MaskAllocError(build_message(errors))
        , errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string build_message(const std::vector<std::string>& errors) {
        std::string msg = "Graph validation failed:\n";
        for (const auto& e : errors) {
            msg += "  - " + e + "\n";
        }
        return msg;
    }

    std::vector<std::string> errors_;
};

} // namespace maskalloc
