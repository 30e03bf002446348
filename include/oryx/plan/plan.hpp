#pragma once

#include <oryx/core/options.hpp>
#include <oryx/core/types.hpp>
#include <oryx/plan/aggregate.hpp>
#include <oryx/plan/catalog.hpp>
#include <oryx/plan/join.hpp>
#include <oryx/plan/pipeline.hpp>
#include <oryx/plan/row_info.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace oryx::plan {

/// Frozen per-table transform: everything needed to turn one source record
/// into an evaluated row indexed by physical slot.
struct TablePlan {
    std::filesystem::path path;
    TableOptions options;
    std::size_t file_width = 0;
    std::size_t slot_count = 0;
    /// Name of every physical slot, for error messages.
    std::vector<std::string> slot_names;
    /// One entry per file column; empty parsers leave the cell as text.
    std::vector<Parser> parsers;
    std::vector<Operation> operations;
    /// Filters in declaration order; `position` indexes into `operations`.
    std::vector<FilterSpec> filters;
};

/// Row-wise projection of a table.
struct SelectPlan {
    TablePlan table;
    /// Physical slots written, in output order.
    std::vector<std::size_t> output;
    std::vector<std::string> header;
};

/// Grouped or whole-table aggregate.
struct AggregatePlan {
    TablePlan table;
    AggregateLayout layout;
};

struct JoinPlan {
    TablePlan left;
    TablePlan right;
    JoinLayout layout;
};

/// Backend-consumable description of one evaluation.
using Plan = std::variant<SelectPlan, AggregatePlan, JoinPlan>;

/// Freeze a table's catalog and row descriptor. With `with_formatters` the
/// deferred formatters of live columns run after every user operation.
[[nodiscard]] auto make_table_plan(const std::filesystem::path& path, const TableOptions& options,
                                   const ColumnCatalog& catalog,
                                   const RowPipelineDescriptor& rows, bool with_formatters)
    -> TablePlan;

/// Plain projection; `select` (nullopt = every live column) is resolved
/// against the catalog and must not be empty.
[[nodiscard]] auto make_select_plan(const std::filesystem::path& path, const TableOptions& options,
                                    const ColumnCatalog& catalog,
                                    const RowPipelineDescriptor& rows,
                                    const std::optional<std::vector<std::string>>& select,
                                    bool with_formatters = true) -> SelectPlan;

[[nodiscard]] auto make_aggregate_plan(const std::filesystem::path& path,
                                       const TableOptions& options, const ColumnCatalog& catalog,
                                       const RowPipelineDescriptor& rows,
                                       const std::optional<std::vector<std::string>>& select)
    -> AggregatePlan;

/// Output header of any plan.
[[nodiscard]] auto plan_header(const Plan& plan) -> const std::vector<std::string>&;

}  // namespace oryx::plan
