#pragma once

#include <oryx/core/value.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace oryx::plan {

/// Row predicate over the values of a filter's columns.
using Predicate = std::function<bool(std::span<const Value>)>;

/// Optional collation applied to a key value before grouping or matching.
using KeyFn = std::function<Value(const Value&)>;

/// A group-by or join key as the user names it.
struct KeySpec {
    std::string column;
    KeyFn collation;

    KeySpec(std::string name) : column(std::move(name)) {}
    KeySpec(const char* name) : column(name) {}
    KeySpec(KeyFn fn, std::string name) : column(std::move(name)), collation(std::move(fn)) {}
};

/// Applies a key's collation (identity when unset).
[[nodiscard]] inline auto collate(const KeyFn& fn, const Value& value) -> Value {
    return fn ? fn(value) : value;
}

/// A filter resolved to physical slots.
struct FilterSpec {
    std::vector<std::size_t> columns;
    Predicate predicate;
    /// Number of pipeline operations that run before this filter.
    std::size_t position = 0;
};

/// A group-by key resolved to a physical slot.
struct GroupKey {
    KeyFn collation;
    std::size_t column = 0;
};

/// Reduction over all values of one column within a group.
struct Aggregator {
    std::string name;
    std::function<Value(std::span<const Value>)> reduce;
};

/// One aggregate output column: `func` over `source`, published as `name`.
struct AggregateSpec {
    Aggregator func;
    std::size_t source = 0;
    std::string name;
};

/// Filters, group-by keys and aggregate specs attached to a table.
///
/// A descriptor with aggregates and no group-by keys is a whole-table
/// aggregate; with group-by keys, the output schema is replaced entirely by
/// the key columns followed by the aggregate columns.
class RowPipelineDescriptor {
   public:
    void add_filter(FilterSpec filter) { filters_.push_back(std::move(filter)); }
    void set_group_by(std::vector<GroupKey> keys) { group_by_ = std::move(keys); }
    void add_aggregate(AggregateSpec spec) { aggregates_.push_back(std::move(spec)); }

    [[nodiscard]] auto filters() const noexcept -> const std::vector<FilterSpec>& {
        return filters_;
    }
    [[nodiscard]] auto group_by() const noexcept -> const std::vector<GroupKey>& {
        return group_by_;
    }
    [[nodiscard]] auto aggregates() const noexcept -> const std::vector<AggregateSpec>& {
        return aggregates_;
    }

    [[nodiscard]] auto is_grouped() const noexcept -> bool { return !group_by_.empty(); }
    [[nodiscard]] auto is_aggregate() const noexcept -> bool {
        return !group_by_.empty() || !aggregates_.empty();
    }

   private:
    std::vector<FilterSpec> filters_;
    std::vector<GroupKey> group_by_;
    std::vector<AggregateSpec> aggregates_;
};

}  // namespace oryx::plan
