#pragma once

#include <stdexcept>
#include <string>

namespace oryx {

/// Raised synchronously while building a plan: unknown column names,
/// argument mismatches, malformed sort specifications, invalid options.
class SchemaError : public std::runtime_error {
   public:
    explicit SchemaError(const std::string& message) : std::runtime_error(message) {}
};

/// Raised when an operation cannot be appended to a pipeline, or when a
/// dry run or full evaluation fails at runtime. The message carries the
/// original cause.
class OperationError : public std::runtime_error {
   public:
    explicit OperationError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace oryx
