#pragma once

#include <oryx/core/value.hpp>
#include <oryx/plan/aggregate.hpp>
#include <oryx/plan/join.hpp>
#include <oryx/plan/plan.hpp>
#include <oryx/runtime/row_source.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace oryx::runtime {

// ─── Row evaluation ─────────────────────────────────────────────────────────

/// Applies a table plan to single source records.
///
/// Parsers run first, then operations in order; each filter is checked right
/// before the operation at its recorded position. The evaluator is stateless
/// and may be shared between threads.
class RowEvaluator {
   public:
    explicit RowEvaluator(const plan::TablePlan& table) : table_(&table) {}

    /// Evaluated row indexed by physical slot, or nullopt when a filter
    /// rejects the record. Throws std::runtime_error naming the failing step.
    [[nodiscard]] auto evaluate(const SourceRow& source) const -> std::optional<Row>;

   private:
    const plan::TablePlan* table_;
};

/// Values of `slots`, in order.
[[nodiscard]] auto project(const Row& row, std::span<const std::size_t> slots) -> Row;

// ─── Aggregation ────────────────────────────────────────────────────────────

/// Assigns dense group ids to collated key tuples in first-seen order.
class GroupIndex {
   public:
    explicit GroupIndex(const plan::AggregateLayout& layout) : layout_(&layout) {}

    /// Collated key tuple of a carried row.
    [[nodiscard]] auto key_of(const Row& carried) const -> std::vector<Value>;

    /// Group id of a carried row, creating the group on first sight.
    auto assign(const Row& carried) -> std::size_t;

    /// Group id of an already collated key tuple.
    auto assign_key(std::vector<Value> key) -> std::size_t;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return keys_.size(); }
    [[nodiscard]] auto key(std::size_t group) const -> const std::vector<Value>& {
        return keys_.at(group);
    }

   private:
    const plan::AggregateLayout* layout_;
    robin_hood::unordered_node_map<std::vector<Value>, std::size_t, TupleHash, TupleEq> ids_;
    std::vector<std::vector<Value>> keys_;
};

/// Output row of one group: keys, then aggregates, permuted by the layout's
/// write index. `rows` are the group's carried rows.
[[nodiscard]] auto reduce_group(const plan::AggregateLayout& layout, const std::vector<Value>& key,
                                const std::vector<Row>& rows, bool format = true) -> Row;

// ─── Joins ──────────────────────────────────────────────────────────────────

/// A materialized build-side row.
struct JoinEntry {
    Row carried;
    Value roll;
};

/// Collated join key of an evaluated row; nullopt if any key value is null.
[[nodiscard]] auto join_key(const plan::JoinSide& side, const Row& row)
    -> std::optional<std::vector<Value>>;

/// Hash index over the build side of a join. As-of buckets are kept sorted by
/// roll value after seal().
class JoinIndex {
   public:
    JoinIndex(const plan::JoinSide& side, bool asof) : side_(&side), asof_(asof) {}

    /// Key and entry of an evaluated build-side row; nullopt for rows that
    /// can never match (null key or null roll value).
    [[nodiscard]] auto entry_of(const Row& row) const
        -> std::optional<std::pair<std::vector<Value>, JoinEntry>>;

    void insert(std::vector<Value> key, JoinEntry entry);

    /// Index an evaluated build-side row.
    void add(const Row& row);

    /// Sort as-of buckets; call once after the last add().
    void seal();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows_; }

    /// Matching entries for a probe key (and roll value for as-of joins).
    [[nodiscard]] auto probe(const std::vector<Value>& key, const Value& roll,
                             plan::JoinKind kind, std::optional<double> limit) const
        -> std::vector<const JoinEntry*>;

   private:
    const plan::JoinSide* side_;
    bool asof_;
    std::size_t rows_ = 0;
    robin_hood::unordered_node_map<std::vector<Value>, std::vector<JoinEntry>, TupleHash, TupleEq>
        buckets_;
};

/// Emits output rows for probe-side rows against a sealed JoinIndex.
class JoinProbe {
   public:
    JoinProbe(const plan::JoinLayout& layout, const JoinIndex& index, bool format = true)
        : layout_(&layout), index_(&index), format_(format) {}

    /// Output rows produced by one evaluated probe-side row.
    [[nodiscard]] auto emit(const Row& row) const -> std::vector<Row>;

   private:
    auto assemble(const Row& left, const Row& right) const -> Row;

    const plan::JoinLayout* layout_;
    const JoinIndex* index_;
    bool format_;
};

}  // namespace oryx::runtime
