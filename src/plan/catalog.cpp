#include <oryx/core/error.hpp>
#include <oryx/plan/catalog.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <unordered_set>

namespace oryx::plan {

namespace {

auto join_names(const std::vector<std::string>& names) -> std::string {
    return names.empty() ? std::string("<none>") : fmt::format("{}", fmt::join(names, ", "));
}

}  // namespace

ColumnCatalog::ColumnCatalog(const std::vector<std::string>& names) {
    slots_.reserve(names.size());
    for (const auto& name : names) {
        if (by_name_.contains(name)) {
            throw SchemaError(fmt::format("duplicate column name: {}", name));
        }
        by_name_.emplace(name, slots_.size());
        order_.push_back(slots_.size());
        slots_.push_back(ColumnInfo{.name = name, .file_backed = true});
        live_.push_back(true);
    }
    file_width_ = names.size();
}

auto ColumnCatalog::find(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = by_name_.find(std::string(name)); it != by_name_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto ColumnCatalog::slot_of(std::string_view name) const -> std::size_t {
    auto slot = find(name);
    if (!slot) {
        throw SchemaError(fmt::format("unknown column: {} (available: {})", name,
                                      join_names(col_names())));
    }
    return *slot;
}

auto ColumnCatalog::col_index() const -> const std::vector<std::size_t>& {
    if (!dense_) {
        std::vector<std::size_t> dense;
        dense.reserve(order_.size());
        for (auto slot : order_) {
            if (live_[slot]) {
                dense.push_back(slot);
            }
        }
        dense_ = std::move(dense);
    }
    return *dense_;
}

auto ColumnCatalog::col_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    const auto& dense = col_index();
    names.reserve(dense.size());
    for (auto slot : dense) {
        names.push_back(slots_[slot].name);
    }
    return names;
}

auto ColumnCatalog::col_types() const -> std::vector<std::pair<std::string, ColumnType>> {
    std::vector<std::pair<std::string, ColumnType>> types;
    for (auto slot : col_index()) {
        types.emplace_back(slots_[slot].name, slots_[slot].type);
    }
    return types;
}

auto ColumnCatalog::dense_position(std::size_t index) const -> std::optional<std::size_t> {
    const auto& dense = col_index();
    auto it = std::find(dense.begin(), dense.end(), index);
    if (it == dense.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - dense.begin());
}

void ColumnCatalog::set_type(std::string_view tag, std::string_view column) {
    auto spec = resolve_type(tag);
    if (!spec) {
        throw SchemaError(fmt::format(
            "unknown type '{}' (expected int, double, string or date); supply a parser instead",
            tag));
    }
    auto index = slot_of(column);
    auto& info = slots_[index];
    info.type = spec->type;
    info.pattern = spec->pattern;
    if (info.file_backed) {
        info.parser = std::move(spec->parser);
    } else {
        pipeline_.append(Operation{.fn = lift(std::move(spec->parser)),
                                   .inputs = {index},
                                   .output = index,
                                   .label = fmt::format("set_type({}, {})", column, tag)});
    }
    pipeline_.set_formatter(index, std::move(spec->formatter));
}

void ColumnCatalog::set_parser(Parser parser, std::string_view column) {
    if (!parser) {
        throw SchemaError("set_parser requires a callable parser");
    }
    auto index = slot_of(column);
    auto& info = slots_[index];
    info.type = ColumnType::Raw;
    info.pattern.clear();
    pipeline_.set_formatter(index, {});
    if (info.file_backed) {
        info.parser = std::move(parser);
    } else {
        pipeline_.append(Operation{.fn = lift(std::move(parser)),
                                   .inputs = {index},
                                   .output = index,
                                   .label = fmt::format("set_parser({})", column)});
    }
}

void ColumnCatalog::operate(UnaryFn fn, std::string_view column) {
    if (!fn) {
        throw SchemaError("operate requires a callable operation");
    }
    auto index = slot_of(column);
    pipeline_.append(Operation{.fn = lift(std::move(fn)),
                               .inputs = {index},
                               .output = index,
                               .label = fmt::format("operate({})", column)});
}

auto ColumnCatalog::operate(RowFn fn, const std::vector<std::string>& inputs,
                            std::string_view new_column) -> std::size_t {
    if (!fn) {
        throw SchemaError("operate requires a callable operation");
    }
    if (new_column.empty()) {
        throw SchemaError("new column name must not be empty");
    }
    if (find(new_column)) {
        throw SchemaError(
            fmt::format("new column '{}' must not be an existing column name", new_column));
    }
    std::vector<std::size_t> resolved;
    resolved.reserve(inputs.size());
    for (const auto& name : inputs) {
        resolved.push_back(slot_of(name));
    }

    std::size_t index = slots_.size();
    slots_.push_back(ColumnInfo{.name = std::string(new_column)});
    live_.push_back(true);
    order_.push_back(index);
    by_name_.emplace(std::string(new_column), index);
    invalidate();

    pipeline_.append(Operation{.fn = std::move(fn),
                               .inputs = std::move(resolved),
                               .output = index,
                               .label = fmt::format("operate({} -> {})", join_names(inputs),
                                                    new_column)});
    return index;
}

void ColumnCatalog::delete_cols(const std::vector<std::string>& columns) {
    std::vector<std::size_t> doomed;
    doomed.reserve(columns.size());
    for (const auto& name : columns) {
        doomed.push_back(slot_of(name));
    }
    for (std::size_t i = 0; i < doomed.size(); ++i) {
        live_[doomed[i]] = false;
        by_name_.erase(columns[i]);
    }
    invalidate();
}

void ColumnCatalog::reorder_cols(const std::vector<std::string>& names) {
    auto current = col_names();
    std::unordered_set<std::string> wanted(names.begin(), names.end());
    std::unordered_set<std::string> have(current.begin(), current.end());
    if (wanted.size() != names.size() || wanted != have) {
        throw SchemaError(fmt::format(
            "reorder must name every existing column exactly once (have: {}; got: {})",
            join_names(current), join_names(names)));
    }

    std::vector<std::size_t> order;
    order.reserve(order_.size());
    for (const auto& name : names) {
        order.push_back(by_name_.at(name));
    }
    for (auto slot : order_) {
        if (!live_[slot]) {
            order.push_back(slot);
        }
    }
    order_ = std::move(order);
    invalidate();
}

void ColumnCatalog::rename_cols(const std::vector<std::string>& names) {
    const auto dense = col_index();
    if (names.size() != dense.size()) {
        throw SchemaError(fmt::format("rename expects {} column names, got {}", dense.size(),
                                      names.size()));
    }
    std::unordered_set<std::string> unique(names.begin(), names.end());
    if (unique.size() != names.size()) {
        throw SchemaError(fmt::format("rename produces duplicate names: {}", join_names(names)));
    }
    for (const auto& name : names) {
        if (name.empty()) {
            throw SchemaError("column names must not be empty");
        }
    }

    by_name_.clear();
    for (std::size_t i = 0; i < dense.size(); ++i) {
        slots_[dense[i]].name = names[i];
        by_name_.emplace(names[i], dense[i]);
    }
    invalidate();
}

}  // namespace oryx::plan
