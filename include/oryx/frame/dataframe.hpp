#pragma once

#include <oryx/core/options.hpp>
#include <oryx/plan/catalog.hpp>
#include <oryx/plan/plan.hpp>
#include <oryx/plan/row_info.hpp>
#include <oryx/runtime/backend.hpp>
#include <oryx/runtime/external_sort.hpp>
#include <oryx/runtime/preview.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oryx {

/// Per-evaluation settings of compute().
struct ComputeOptions {
    std::size_t num_workers = 1;
    std::filesystem::path output_path;
    bool raise_on_error = false;
    bool preserve_order = true;
    /// Output columns to keep; mutually exclusive with `exclude`.
    std::optional<std::vector<std::string>> select;
    /// Output columns to drop; mutually exclusive with `select`.
    std::optional<std::vector<std::string>> exclude;
    /// Scratch directory; `$ORYX_WORK_DIR` or `<temp>/oryx` when empty.
    std::filesystem::path work_dir;
};

/// Lazy, file-backed table.
///
/// Builder calls record work against the table's column catalog and row
/// descriptor; nothing is read beyond the header until preview(), compute()
/// or sort(). Every builder call is followed by a dry run over the first rows
/// of the file. A call that fails leaves the frame exactly as it was before
/// the call:
///   - schema problems (unknown names, bad arguments) throw SchemaError;
///   - a failing dry run throws OperationError carrying the original cause.
class DataFrame {
   public:
    /// Open a delimited file. Only its first record is read.
    [[nodiscard]] static auto from_csv(const std::filesystem::path& path,
                                       TableOptions options = {}) -> DataFrame;

    // ─── Builder ────────────────────────────────────────────────────────────

    /// Replace a column's values with `fn(value)`.
    auto operate(plan::UnaryFn fn, std::string_view column) -> DataFrame&;

    /// Add `new_column` computed from the values of `columns`.
    auto operate(plan::RowFn fn, const std::vector<std::string>& columns,
                 std::string_view new_column) -> DataFrame&;

    /// Declare a column type: `int`, `double`, `string`, `date` or
    /// `date:<pattern>`.
    auto set_type(std::string_view tag, std::string_view column) -> DataFrame&;

    auto set_parser(Parser parser, std::string_view column) -> DataFrame&;

    /// Keep rows for which `predicate` holds over `columns`. The filter sees
    /// the row after the operations declared before it.
    auto filter(const std::vector<std::string>& columns, plan::Predicate predicate) -> DataFrame&;

    auto group_by(const std::vector<plan::KeySpec>& keys) -> DataFrame&;

    /// Aggregate each of `columns` with `func`. New names default to
    /// `<func>(<column>)`.
    auto aggregate(const plan::Aggregator& func, const std::vector<std::string>& columns,
                   const std::vector<std::string>& new_names = {}) -> DataFrame&;

    auto delete_col(const std::vector<std::string>& columns) -> DataFrame&;

    /// Keep only `columns` (in their current order).
    auto select_col(const std::vector<std::string>& columns) -> DataFrame&;

    auto reorder_col(const std::vector<std::string>& names) -> DataFrame&;
    auto rename_col(const std::vector<std::string>& names) -> DataFrame&;

    // ─── Queries ────────────────────────────────────────────────────────────

    /// Output schema: live columns, or keys then aggregate names once the
    /// frame aggregates.
    [[nodiscard]] auto col_names() const -> std::vector<std::string>;
    [[nodiscard]] auto col_types() const -> std::vector<std::pair<std::string, ColumnType>>;
    [[nodiscard]] auto col_index() const -> std::vector<std::size_t>;

    /// First `n` raw data records.
    [[nodiscard]] auto head(std::size_t n = 10) const -> std::vector<std::vector<std::string>>;

    /// Dry run over the first `sample_size` records. Throws OperationError.
    [[nodiscard]] auto preview(std::size_t sample_size = 10, std::size_t return_size = 10,
                               bool format = true) const -> runtime::PreviewResult;

    /// Freeze the current state into a plan.
    [[nodiscard]] auto plan(const std::optional<std::vector<std::string>>& select = std::nullopt,
                            bool with_formatters = true) const -> plan::Plan;

    /// Evaluate into `options.output_path`. Uses a LocalBackend when
    /// `backend` is null.
    auto compute(const ComputeOptions& options, runtime::ExecutionBackend* backend = nullptr) const
        -> runtime::ExecutionReport;

    /// External sort of the source file by `spec` (e.g. `{"+", "Salary"}`).
    /// Returns the number of data rows written.
    auto sort(const std::vector<std::string>& spec, const std::filesystem::path& output,
              runtime::SortOptions options = {}) const -> std::size_t;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto options() const -> const TableOptions& { return options_; }
    [[nodiscard]] auto catalog() const -> const plan::ColumnCatalog& { return state_.catalog; }
    [[nodiscard]] auto rows() const -> const plan::RowPipelineDescriptor& { return state_.rows; }
    [[nodiscard]] auto is_aggregate() const -> bool { return state_.rows.is_aggregate(); }

    /// Size of the source file in bytes.
    [[nodiscard]] auto file_size() const -> std::uintmax_t;

   private:
    struct State {
        plan::ColumnCatalog catalog;
        plan::RowPipelineDescriptor rows;
    };

    DataFrame(std::filesystem::path path, TableOptions options, plan::ColumnCatalog catalog);

    template <typename Fn>
    void mutate(std::string_view context, Fn&& fn);

    std::filesystem::path path_;
    TableOptions options_;
    State state_;
};

/// Resolve `select` / `exclude` of compute options against an output schema.
/// Throws SchemaError when both are given, or for unknown names.
[[nodiscard]] auto resolve_selection(const ComputeOptions& options,
                                     const std::vector<std::string>& names)
    -> std::optional<std::vector<std::string>>;

/// Check worker bounds and convert to backend options. Throws SchemaError.
[[nodiscard]] auto execution_options(const ComputeOptions& options)
    -> runtime::ExecutionOptions;

/// Run a plan on `backend` (a LocalBackend when null); a failed run throws
/// OperationError with the original cause appended.
auto run_plan(const plan::Plan& plan, const ComputeOptions& options,
              runtime::ExecutionBackend* backend) -> runtime::ExecutionReport;

}  // namespace oryx
