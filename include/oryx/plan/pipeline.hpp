#pragma once

#include <oryx/core/types.hpp>
#include <oryx/core/value.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace oryx::plan {

/// User function over the values of an operation's input columns.
using RowFn = std::function<Value(std::span<const Value>)>;

/// User function over a single column value.
using UnaryFn = std::function<Value(const Value&)>;

/// One column-level transform: evaluates `fn` over `inputs` and stores the
/// result in `output`. All indices are physical column slots.
struct Operation {
    RowFn fn;
    std::vector<std::size_t> inputs;
    std::size_t output = 0;
    /// Short description used in error messages, e.g. "operate(Salary)".
    std::string label;
};

/// Adapt a single-column function to the RowFn shape.
[[nodiscard]] auto lift(UnaryFn fn) -> RowFn;

/// Ordered list of column transforms plus deferred formatters.
///
/// Building happens in two phases. While the user chains calls, operations
/// and formatters accumulate separately; finalize() then produces one
/// immutable operator list with every formatter placed after every
/// operation, so type formatting is always the last transform applied to a
/// column.
class OperationPipeline {
   public:
    void append(Operation op) { operations_.push_back(std::move(op)); }

    /// Record (or replace) the formatter for a column slot.
    void set_formatter(std::size_t slot, Formatter formatter);

    [[nodiscard]] auto operations() const noexcept -> const std::vector<Operation>& {
        return operations_;
    }

    [[nodiscard]] auto formatters() const noexcept -> const std::map<std::size_t, Formatter>& {
        return formatters_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return operations_.size(); }

    /// Operations followed by one formatting operation per live slot that
    /// carries a formatter. `live[slot]` is false for tombstoned columns.
    [[nodiscard]] auto finalize(const std::vector<bool>& live) const -> std::vector<Operation>;

   private:
    std::vector<Operation> operations_;
    std::map<std::size_t, Formatter> formatters_;
};

}  // namespace oryx::plan
