#include <oryx/core/error.hpp>
#include <oryx/plan/sort.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>
#include <utility>

namespace oryx::plan {

auto parse_sort_spec(const std::vector<std::string>& spec, const ColumnCatalog& catalog)
    -> std::vector<SortKey> {
    if (spec.empty()) {
        throw SchemaError("sort order must not be empty");
    }
    if (spec.size() % 2 != 0) {
        throw SchemaError(fmt::format(
            "sort order must alternate direction and column name, got: {}", fmt::join(spec, ",")));
    }

    std::vector<SortKey> keys;
    keys.reserve(spec.size() / 2);
    for (std::size_t i = 0; i < spec.size(); i += 2) {
        const auto& direction = spec[i];
        const auto& name = spec[i + 1];
        if (direction != "+" && direction != "-") {
            throw SchemaError(fmt::format(
                "expected '+' or '-' at position {} of sort order, got '{}'", i, direction));
        }
        if (name == "+" || name == "-") {
            throw SchemaError(
                fmt::format("expected a column name at position {} of sort order", i + 1));
        }
        auto slot = catalog.slot_of(name);
        const auto& info = catalog.slot(slot);
        if (!info.file_backed) {
            throw SchemaError(
                fmt::format("cannot sort on computed column '{}'; sort keys must be file columns",
                            name));
        }
        keys.push_back(SortKey{.column = slot,
                               .descending = direction == "-",
                               .parser = info.parser,
                               .name = name});
    }
    return keys;
}

RowComparator::RowComparator(std::vector<SortKey> keys) : keys_(std::move(keys)) {}

auto RowComparator::extract(const std::vector<std::string>& fields) const -> std::vector<Value> {
    std::vector<Value> out;
    out.reserve(keys_.size());
    for (const auto& key : keys_) {
        if (key.column >= fields.size()) {
            throw std::out_of_range(
                fmt::format("record has {} field(s), sort key '{}' needs column {}",
                            fields.size(), key.name, key.column + 1));
        }
        Value cell{fields[key.column]};
        out.push_back(key.parser ? key.parser(cell) : std::move(cell));
    }
    return out;
}

auto RowComparator::compare(std::span<const Value> lhs, std::span<const Value> rhs) const
    -> int {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        int c = compare_values(lhs[i], rhs[i]);
        if (c != 0) {
            return keys_[i].descending ? -c : c;
        }
    }
    return 0;
}

}  // namespace oryx::plan
