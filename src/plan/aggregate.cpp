#include <oryx/core/error.hpp>
#include <oryx/plan/aggregate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

namespace oryx::plan {

namespace {

auto position_in(const std::vector<std::size_t>& sorted, std::size_t slot) -> std::size_t {
    auto it = std::lower_bound(sorted.begin(), sorted.end(), slot);
    return static_cast<std::size_t>(it - sorted.begin());
}

}  // namespace

GroupAggregateIndexer::GroupAggregateIndexer(const ColumnCatalog& catalog,
                                             const RowPipelineDescriptor& rows)
    : catalog_(&catalog), rows_(&rows) {}

auto GroupAggregateIndexer::output_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(rows_->group_by().size() + rows_->aggregates().size());
    for (const auto& key : rows_->group_by()) {
        if (!catalog_->is_live(key.column)) {
            throw SchemaError(fmt::format("group-by key '{}' was deleted",
                                          catalog_->slot(key.column).name));
        }
        names.push_back(catalog_->slot(key.column).name);
    }
    for (const auto& spec : rows_->aggregates()) {
        names.push_back(spec.name);
    }
    return names;
}

auto GroupAggregateIndexer::layout(const std::optional<std::vector<std::string>>& select) const
    -> AggregateLayout {
    const auto names = output_names();
    const std::size_t n_keys = rows_->group_by().size();

    // Positions in the virtual schema, in the caller's order.
    std::vector<std::size_t> selected;
    if (select) {
        selected.reserve(select->size());
        for (const auto& name : *select) {
            auto it = std::find(names.begin(), names.end(), name);
            if (it == names.end()) {
                throw SchemaError(fmt::format("unknown output column: {} (available: {})", name,
                                              fmt::join(names, ", ")));
            }
            selected.push_back(static_cast<std::size_t>(it - names.begin()));
        }
    } else {
        for (std::size_t i = 0; i < names.size(); ++i) {
            selected.push_back(i);
        }
    }
    if (selected.empty()) {
        throw SchemaError("must select at least one column");
    }

    // Aggregates actually needed, kept in declaration order.
    std::set<std::size_t> needed_aggs;
    for (auto pos : selected) {
        if (pos >= n_keys) {
            needed_aggs.insert(pos - n_keys);
        }
    }

    std::set<std::size_t> carried;
    for (const auto& key : rows_->group_by()) {
        carried.insert(key.column);
    }
    for (auto agg : needed_aggs) {
        const auto& spec = rows_->aggregates()[agg];
        if (!catalog_->is_live(spec.source)) {
            throw SchemaError(fmt::format("aggregate '{}' reads deleted column '{}'", spec.name,
                                          catalog_->slot(spec.source).name));
        }
        carried.insert(spec.source);
    }

    AggregateLayout out;
    out.grouped = rows_->is_grouped();
    out.carried.assign(carried.begin(), carried.end());

    for (const auto& key : rows_->group_by()) {
        out.keys.push_back(
            KeyRef{.collation = key.collation, .position = position_in(out.carried, key.column)});
    }
    const auto& formatters = catalog_->pipeline().formatters();
    std::vector<std::size_t> produced_of_agg(rows_->aggregates().size(), 0);
    for (auto agg : needed_aggs) {
        const auto& spec = rows_->aggregates()[agg];
        produced_of_agg[agg] = n_keys + out.aggregates.size();
        AggregateRef ref{.func = spec.func,
                         .position = position_in(out.carried, spec.source),
                         .name = spec.name,
                         .source_type = catalog_->slot(spec.source).type};
        if (auto it = formatters.find(spec.source); it != formatters.end()) {
            ref.formatter = it->second;
        }
        out.aggregates.push_back(std::move(ref));
    }

    out.write_index.reserve(selected.size());
    out.header.reserve(selected.size());
    for (auto pos : selected) {
        out.write_index.push_back(pos < n_keys ? pos : produced_of_agg[pos - n_keys]);
        out.header.push_back(names[pos]);
    }

    for (const auto& key : rows_->group_by()) {
        if (key.collation) {
            continue;
        }
        if (auto it = formatters.find(key.column); it != formatters.end()) {
            out.formatters.insert_or_assign(position_in(out.carried, key.column), it->second);
        }
    }

    spdlog::debug("aggregate layout: {} carried column(s), {} key(s), {} aggregate(s)",
                  out.carried.size(), out.keys.size(), out.aggregates.size());
    return out;
}

}  // namespace oryx::plan
