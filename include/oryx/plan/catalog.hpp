#pragma once

#include <oryx/core/types.hpp>
#include <oryx/plan/pipeline.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oryx::plan {

/// Metadata of one physical column slot.
struct ColumnInfo {
    std::string name;
    ColumnType type = ColumnType::Raw;
    /// Date pattern when `type` is Date.
    std::string pattern;
    /// Read-time parser; only file-backed slots carry one.
    Parser parser;
    /// True for slots read from the source file, false for computed columns.
    bool file_backed = false;
};

/// Per-table registry of columns.
///
/// Every column owns a physical slot that never moves: file columns occupy
/// slots 0..n-1 in file order and computed columns are appended after them.
/// Deleting a column only clears its liveness bit, so operations recorded
/// against other slots stay valid. The user-facing order is a separate
/// permutation of slots; col_index() is the dense view of that order with
/// tombstones removed, recomputed lazily after each mutation.
///
/// Mutators throw SchemaError on unknown names or malformed arguments.
class ColumnCatalog {
   public:
    ColumnCatalog() = default;

    /// Catalog over file columns named `names`, in file order.
    explicit ColumnCatalog(const std::vector<std::string>& names);

    // ─── Lookup ─────────────────────────────────────────────────────────────

    /// Slot of a live column, or nullopt.
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;

    /// Slot of a live column; throws SchemaError for an unknown name.
    [[nodiscard]] auto slot_of(std::string_view name) const -> std::size_t;

    [[nodiscard]] auto slot(std::size_t index) const -> const ColumnInfo& {
        return slots_.at(index);
    }
    [[nodiscard]] auto slot_count() const noexcept -> std::size_t { return slots_.size(); }
    [[nodiscard]] auto file_width() const noexcept -> std::size_t { return file_width_; }
    [[nodiscard]] auto is_live(std::size_t index) const -> bool { return live_.at(index); }
    [[nodiscard]] auto liveness() const noexcept -> const std::vector<bool>& { return live_; }

    /// Physical slots of the non-deleted columns, in current column order.
    [[nodiscard]] auto col_index() const -> const std::vector<std::size_t>&;

    /// Names of the non-deleted columns, in current column order.
    [[nodiscard]] auto col_names() const -> std::vector<std::string>;

    [[nodiscard]] auto col_types() const -> std::vector<std::pair<std::string, ColumnType>>;

    /// Position of a slot within col_index(), or nullopt if deleted.
    [[nodiscard]] auto dense_position(std::size_t index) const -> std::optional<std::size_t>;

    [[nodiscard]] auto pipeline() const noexcept -> const OperationPipeline& { return pipeline_; }

    // ─── Mutation ───────────────────────────────────────────────────────────

    /// Declare a column's type from a registry tag. Records the parser and
    /// registers the tag's formatter.
    void set_type(std::string_view tag, std::string_view column);

    /// Attach a user parser; the column's declared type becomes Raw.
    void set_parser(Parser parser, std::string_view column);

    /// Replace a column's value in place.
    void operate(UnaryFn fn, std::string_view column);

    /// Compute a new column from `inputs`; returns the new slot.
    auto operate(RowFn fn, const std::vector<std::string>& inputs, std::string_view new_column)
        -> std::size_t;

    /// Tombstone columns. Indices are not renumbered.
    void delete_cols(const std::vector<std::string>& columns);

    /// `names` must be exactly the set of live column names.
    void reorder_cols(const std::vector<std::string>& names);

    /// Rename live columns in current order; indices are preserved.
    void rename_cols(const std::vector<std::string>& names);

   private:
    void invalidate() noexcept { dense_.reset(); }

    std::vector<ColumnInfo> slots_;
    std::vector<bool> live_;
    /// All slots, tombstones included, in user-facing order.
    std::vector<std::size_t> order_;
    std::unordered_map<std::string, std::size_t> by_name_;
    std::size_t file_width_ = 0;
    OperationPipeline pipeline_;
    mutable std::optional<std::vector<std::size_t>> dense_;
};

}  // namespace oryx::plan
