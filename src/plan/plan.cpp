#include <oryx/core/error.hpp>
#include <oryx/plan/plan.hpp>

#include <spdlog/spdlog.h>

#include <type_traits>

namespace oryx::plan {

auto make_table_plan(const std::filesystem::path& path, const TableOptions& options,
                     const ColumnCatalog& catalog, const RowPipelineDescriptor& rows,
                     bool with_formatters) -> TablePlan {
    TablePlan table{.path = path,
                    .options = options,
                    .file_width = catalog.file_width(),
                    .slot_count = catalog.slot_count()};
    table.slot_names.reserve(catalog.slot_count());
    for (std::size_t i = 0; i < catalog.slot_count(); ++i) {
        table.slot_names.push_back(catalog.slot(i).name);
    }
    table.parsers.reserve(catalog.file_width());
    for (std::size_t i = 0; i < catalog.file_width(); ++i) {
        table.parsers.push_back(catalog.slot(i).parser);
    }
    table.operations = with_formatters ? catalog.pipeline().finalize(catalog.liveness())
                                       : catalog.pipeline().operations();
    table.filters = rows.filters();
    return table;
}

auto make_select_plan(const std::filesystem::path& path, const TableOptions& options,
                      const ColumnCatalog& catalog, const RowPipelineDescriptor& rows,
                      const std::optional<std::vector<std::string>>& select, bool with_formatters)
    -> SelectPlan {
    SelectPlan plan{.table = make_table_plan(path, options, catalog, rows, with_formatters)};
    if (select) {
        for (const auto& name : *select) {
            plan.output.push_back(catalog.slot_of(name));
            plan.header.push_back(name);
        }
    } else {
        plan.output = catalog.col_index();
        plan.header = catalog.col_names();
    }
    if (plan.output.empty()) {
        throw SchemaError("must select at least one column");
    }
    spdlog::debug("select plan over {}: {} operation(s), {} filter(s), {} output column(s)",
                  path.string(), plan.table.operations.size(), plan.table.filters.size(),
                  plan.output.size());
    return plan;
}

auto make_aggregate_plan(const std::filesystem::path& path, const TableOptions& options,
                         const ColumnCatalog& catalog, const RowPipelineDescriptor& rows,
                         const std::optional<std::vector<std::string>>& select)
    -> AggregatePlan {
    GroupAggregateIndexer indexer(catalog, rows);
    return AggregatePlan{.table = make_table_plan(path, options, catalog, rows, false),
                         .layout = indexer.layout(select)};
}

auto plan_header(const Plan& plan) -> const std::vector<std::string>& {
    return std::visit(
        [](const auto& p) -> const std::vector<std::string>& {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, SelectPlan>) {
                return p.header;
            } else {
                return p.layout.header;
            }
        },
        plan);
}

}  // namespace oryx::plan
