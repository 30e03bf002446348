#include <oryx/runtime/evaluator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace oryx::runtime {

namespace {

auto is_asof(plan::JoinKind kind) -> bool {
    return kind == plan::JoinKind::AsofForward || kind == plan::JoinKind::AsofBackward;
}

auto within_limit(const Value& from, const Value& to, std::optional<double> limit) -> bool {
    if (!limit) {
        return true;
    }
    auto lo = as_double(from);
    auto hi = as_double(to);
    if (!lo || !hi) {
        return false;
    }
    return *hi - *lo <= *limit;
}

auto holds_type(const Value& value, ColumnType type) -> bool {
    switch (type) {
        case ColumnType::Int:
            return kind_of(value) == ValueKind::Int;
        case ColumnType::Double:
            return kind_of(value) == ValueKind::Double;
        case ColumnType::String:
            return kind_of(value) == ValueKind::String;
        case ColumnType::Date:
            return kind_of(value) == ValueKind::Date;
        case ColumnType::Raw:
            return false;
    }
    return false;
}

auto entry_roll_less(const JoinEntry& lhs, const JoinEntry& rhs) -> bool {
    return compare_values(lhs.roll, rhs.roll) < 0;
}

}  // namespace

auto RowEvaluator::evaluate(const SourceRow& source) const -> std::optional<Row> {
    const auto& table = *table_;
    if (source.fields.size() != table.file_width) {
        throw std::runtime_error(fmt::format("record has {} field(s), expected {}",
                                             source.fields.size(), table.file_width));
    }

    Row row(table.slot_count);
    for (std::size_t i = 0; i < table.file_width; ++i) {
        Value cell{source.fields[i]};
        if (!table.parsers[i]) {
            row[i] = std::move(cell);
            continue;
        }
        try {
            row[i] = table.parsers[i](cell);
        } catch (const std::exception& e) {
            throw std::runtime_error(
                fmt::format("parsing column '{}': {}", table.slot_names[i], e.what()));
        }
    }

    std::vector<Value> args;
    std::size_t next_filter = 0;
    auto passes_filters = [&](std::size_t position) -> bool {
        while (next_filter < table.filters.size() &&
               table.filters[next_filter].position <= position) {
            const auto& filter = table.filters[next_filter++];
            args.clear();
            for (auto slot : filter.columns) {
                args.push_back(row[slot]);
            }
            bool keep = false;
            try {
                keep = filter.predicate(args);
            } catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("filter #{}: {}", next_filter, e.what()));
            }
            if (!keep) {
                return false;
            }
        }
        return true;
    };

    for (std::size_t k = 0; k < table.operations.size(); ++k) {
        if (!passes_filters(k)) {
            return std::nullopt;
        }
        const auto& op = table.operations[k];
        args.clear();
        for (auto slot : op.inputs) {
            args.push_back(row[slot]);
        }
        try {
            row[op.output] = op.fn(args);
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format("{}: {}", op.label, e.what()));
        }
    }
    if (!passes_filters(table.operations.size())) {
        return std::nullopt;
    }
    return row;
}

auto project(const Row& row, std::span<const std::size_t> slots) -> Row {
    Row out;
    out.reserve(slots.size());
    for (auto slot : slots) {
        out.push_back(row[slot]);
    }
    return out;
}

// ─── Aggregation ────────────────────────────────────────────────────────────

auto GroupIndex::key_of(const Row& carried) const -> std::vector<Value> {
    std::vector<Value> key;
    key.reserve(layout_->keys.size());
    for (const auto& ref : layout_->keys) {
        key.push_back(plan::collate(ref.collation, carried[ref.position]));
    }
    return key;
}

auto GroupIndex::assign(const Row& carried) -> std::size_t {
    return assign_key(key_of(carried));
}

auto GroupIndex::assign_key(std::vector<Value> key) -> std::size_t {
    auto [it, inserted] = ids_.try_emplace(key, keys_.size());
    if (inserted) {
        keys_.push_back(std::move(key));
    }
    return it->second;
}

auto reduce_group(const plan::AggregateLayout& layout, const std::vector<Value>& key,
                  const std::vector<Row>& rows, bool format) -> Row {
    Row produced;
    produced.reserve(layout.keys.size() + layout.aggregates.size());
    for (std::size_t i = 0; i < layout.keys.size(); ++i) {
        Value value = key[i];
        if (format && !is_null(value)) {
            if (auto it = layout.formatters.find(layout.keys[i].position);
                it != layout.formatters.end()) {
                value = it->second(value);
            }
        }
        produced.push_back(std::move(value));
    }

    std::vector<Value> column;
    for (const auto& agg : layout.aggregates) {
        column.clear();
        column.reserve(rows.size());
        for (const auto& row : rows) {
            column.push_back(row[agg.position]);
        }
        Value value;
        try {
            value = agg.func.reduce(column);
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format("aggregate '{}': {}", agg.name, e.what()));
        }
        if (format && agg.formatter && holds_type(value, agg.source_type)) {
            value = agg.formatter(value);
        }
        produced.push_back(std::move(value));
    }

    Row out;
    out.reserve(layout.write_index.size());
    for (auto index : layout.write_index) {
        out.push_back(produced[index]);
    }
    return out;
}

// ─── Joins ──────────────────────────────────────────────────────────────────

auto join_key(const plan::JoinSide& side, const Row& row) -> std::optional<std::vector<Value>> {
    std::vector<Value> key;
    key.reserve(side.keys.size());
    for (std::size_t i = 0; i < side.keys.size(); ++i) {
        auto value = plan::collate(side.collations[i], row[side.keys[i]]);
        if (is_null(value)) {
            return std::nullopt;
        }
        key.push_back(std::move(value));
    }
    return key;
}

auto JoinIndex::entry_of(const Row& row) const
    -> std::optional<std::pair<std::vector<Value>, JoinEntry>> {
    auto key = join_key(*side_, row);
    if (!key) {
        return std::nullopt;
    }
    JoinEntry entry{.carried = project(row, side_->carried)};
    if (asof_) {
        entry.roll = row[*side_->roll];
        if (is_null(entry.roll)) {
            return std::nullopt;
        }
    }
    return std::make_pair(std::move(*key), std::move(entry));
}

void JoinIndex::insert(std::vector<Value> key, JoinEntry entry) {
    buckets_[std::move(key)].push_back(std::move(entry));
    ++rows_;
}

void JoinIndex::add(const Row& row) {
    if (auto item = entry_of(row)) {
        insert(std::move(item->first), std::move(item->second));
    }
}

void JoinIndex::seal() {
    if (!asof_) {
        return;
    }
    for (auto& [key, entries] : buckets_) {
        std::stable_sort(entries.begin(), entries.end(), entry_roll_less);
    }
}

auto JoinIndex::probe(const std::vector<Value>& key, const Value& roll, plan::JoinKind kind,
                      std::optional<double> limit) const -> std::vector<const JoinEntry*> {
    std::vector<const JoinEntry*> matches;
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return matches;
    }
    const auto& entries = it->second;
    if (!is_asof(kind)) {
        matches.reserve(entries.size());
        for (const auto& entry : entries) {
            matches.push_back(&entry);
        }
        return matches;
    }
    if (is_null(roll)) {
        return matches;
    }

    JoinEntry needle{.roll = roll};
    if (kind == plan::JoinKind::AsofForward) {
        auto pos = std::lower_bound(entries.begin(), entries.end(), needle, entry_roll_less);
        if (pos != entries.end() && within_limit(roll, pos->roll, limit)) {
            matches.push_back(&*pos);
        }
    } else {
        auto pos = std::upper_bound(entries.begin(), entries.end(), needle, entry_roll_less);
        if (pos != entries.begin()) {
            --pos;
            if (within_limit(pos->roll, roll, limit)) {
                matches.push_back(&*pos);
            }
        }
    }
    return matches;
}

auto JoinProbe::assemble(const Row& left, const Row& right) const -> Row {
    const auto& layout = *layout_;
    Row combined;
    combined.reserve(left.size() + right.size());
    combined.insert(combined.end(), left.begin(), left.end());
    combined.insert(combined.end(), right.begin(), right.end());
    if (format_) {
        for (const auto& [pos, formatter] : layout.left.formatters) {
            if (!is_null(combined[pos])) {
                combined[pos] = formatter(combined[pos]);
            }
        }
        for (const auto& [pos, formatter] : layout.right.formatters) {
            auto at = left.size() + pos;
            if (!is_null(combined[at])) {
                combined[at] = formatter(combined[at]);
            }
        }
    }
    Row out;
    out.reserve(layout.write_index.size());
    for (auto index : layout.write_index) {
        out.push_back(combined[index]);
    }
    return out;
}

auto JoinProbe::emit(const Row& row) const -> std::vector<Row> {
    const auto& layout = *layout_;
    const auto& probe_side = layout.build_left ? layout.right : layout.left;
    std::vector<Row> out;

    auto probe_carried = project(row, probe_side.carried);
    auto key = join_key(probe_side, row);
    std::vector<const JoinEntry*> matches;
    if (key) {
        Value roll = probe_side.roll ? row[*probe_side.roll] : Value{};
        matches = index_->probe(*key, roll, layout.kind, layout.limit);
    }

    for (const auto* entry : matches) {
        out.push_back(layout.build_left ? assemble(entry->carried, probe_carried)
                                        : assemble(probe_carried, entry->carried));
    }

    bool pad = layout.kind == plan::JoinKind::Left ||
               (is_asof(layout.kind) && layout.keep_unmatched);
    if (matches.empty() && pad && !layout.build_left) {
        Row nulls(layout.right.carried.size());
        out.push_back(assemble(probe_carried, nulls));
    }
    return out;
}

}  // namespace oryx::runtime
