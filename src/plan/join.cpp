#include <oryx/core/error.hpp>
#include <oryx/plan/join.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

namespace oryx::plan {

namespace {

auto is_asof(JoinKind kind) -> bool {
    return kind == JoinKind::AsofForward || kind == JoinKind::AsofBackward;
}

auto is_numeric(ColumnType type) -> bool {
    return type == ColumnType::Int || type == ColumnType::Double;
}

auto comparable(ColumnType lhs, ColumnType rhs) -> bool {
    if (is_numeric(lhs) && is_numeric(rhs)) {
        return true;
    }
    return lhs == rhs;
}

void check_keys(const ColumnCatalog& catalog, const std::vector<KeySpec>& keys,
                const char* side) {
    for (const auto& key : keys) {
        if (!catalog.find(key.column)) {
            throw SchemaError(fmt::format("{} join key not found: {} (available: {})", side,
                                          key.column, fmt::join(catalog.col_names(), ", ")));
        }
    }
}

auto build_side(const ColumnCatalog& catalog, const std::string& prefix,
                const std::vector<std::size_t>& positions, const std::vector<KeySpec>& keys,
                std::optional<std::size_t> roll) -> JoinSide {
    JoinSide side;
    side.prefix = prefix;
    const auto& dense = catalog.col_index();
    side.carried.reserve(positions.size());
    for (auto pos : positions) {
        side.carried.push_back(dense[pos]);
    }
    for (const auto& key : keys) {
        auto slot = catalog.find(key.column);
        if (!slot) {
            throw SchemaError(fmt::format("join key '{}' is no longer a live column", key.column));
        }
        side.keys.push_back(*slot);
        side.collations.push_back(key.collation);
    }
    if (roll) {
        if (!catalog.is_live(*roll)) {
            throw SchemaError(fmt::format("roll column '{}' is no longer a live column",
                                          catalog.slot(*roll).name));
        }
        side.roll = roll;
    }
    const auto& formatters = catalog.pipeline().formatters();
    for (std::size_t i = 0; i < side.carried.size(); ++i) {
        if (auto it = formatters.find(side.carried[i]); it != formatters.end()) {
            side.formatters.insert_or_assign(i, it->second);
        }
    }
    return side;
}

}  // namespace

auto join_kind_name(JoinKind kind) -> const char* {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
        case JoinKind::AsofForward:
            return "asof-forward";
        case JoinKind::AsofBackward:
            return "asof-backward";
    }
    return "unknown";
}

JoinPlanner::JoinPlanner(const ColumnCatalog& left, const ColumnCatalog& right, JoinKind kind,
                         std::vector<KeySpec> left_keys, std::vector<KeySpec> right_keys,
                         JoinOptions options, std::optional<std::string> left_roll,
                         std::optional<std::string> right_roll)
    : left_(&left),
      right_(&right),
      kind_(kind),
      left_keys_(std::move(left_keys)),
      right_keys_(std::move(right_keys)),
      options_(std::move(options)) {
    if (kind_ == JoinKind::Right) {
        std::swap(left_, right_);
        std::swap(left_keys_, right_keys_);
        std::swap(options_.prefix[0], options_.prefix[1]);
        std::swap(left_roll, right_roll);
        kind_ = JoinKind::Left;
        swapped_ = true;
    }

    if (left_keys_.empty()) {
        throw SchemaError("join requires at least one key");
    }
    if (left_keys_.size() != right_keys_.size()) {
        throw SchemaError(fmt::format("left and right key counts differ ({} vs {})",
                                      left_keys_.size(), right_keys_.size()));
    }
    check_keys(*left_, left_keys_, "left");
    check_keys(*right_, right_keys_, "right");

    if (options_.prefix[0] == options_.prefix[1]) {
        throw SchemaError(
            fmt::format("join prefixes must differ, both are '{}'", options_.prefix[0]));
    }
    if (options_.limit && *options_.limit < 0.0) {
        throw SchemaError("as-of limit must not be negative");
    }
    if (!is_asof(kind_)) {
        if (left_roll || right_roll || options_.limit) {
            throw SchemaError(fmt::format("roll columns and limit only apply to as-of joins, not {}",
                                          join_kind_name(kind_)));
        }
        return;
    }

    if (!left_roll || !right_roll) {
        throw SchemaError("as-of joins require a roll column on both sides");
    }
    left_roll_ = left_->find(*left_roll);
    right_roll_ = right_->find(*right_roll);
    if (!left_roll_ || !right_roll_) {
        throw SchemaError(fmt::format("roll columns include non-existent column name(s): {}, {}",
                                      *left_roll, *right_roll));
    }
    auto lt = left_->slot(*left_roll_).type;
    auto rt = right_->slot(*right_roll_).type;
    if (lt == ColumnType::Raw || rt == ColumnType::Raw) {
        throw SchemaError(fmt::format(
            "as-of roll columns need a declared type (int, double, date or string): {} is {}, "
            "{} is {}",
            *left_roll, type_name(lt), *right_roll, type_name(rt)));
    }
    if (!comparable(lt, rt)) {
        throw SchemaError(fmt::format("roll columns are not comparable ({} vs {})", type_name(lt),
                                      type_name(rt)));
    }
    if (options_.limit && (lt == ColumnType::String || rt == ColumnType::String)) {
        throw SchemaError("as-of limit requires numeric or date roll columns");
    }
}

auto JoinPlanner::output_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& name : left_->col_names()) {
        names.push_back(fmt::format("{}_{}", options_.prefix[0], name));
    }
    for (const auto& name : right_->col_names()) {
        names.push_back(fmt::format("{}_{}", options_.prefix[1], name));
    }
    return names;
}

auto JoinPlanner::layout(const std::optional<std::vector<std::string>>& select,
                         std::uintmax_t left_bytes, std::uintmax_t right_bytes) const
    -> JoinLayout {
    const auto names = output_names();
    const std::size_t n_left = left_->col_index().size();

    std::vector<std::size_t> selected;
    if (select) {
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

    std::set<std::size_t> left_set;
    std::set<std::size_t> right_set;
    for (auto pos : selected) {
        if (pos < n_left) {
            left_set.insert(pos);
        } else {
            right_set.insert(pos - n_left);
        }
    }
    std::vector<std::size_t> left_pos(left_set.begin(), left_set.end());
    std::vector<std::size_t> right_pos(right_set.begin(), right_set.end());

    JoinLayout out;
    out.kind = kind_;
    out.limit = options_.limit;
    out.keep_unmatched = options_.keep_unmatched;
    out.left = build_side(*left_, options_.prefix[0], left_pos, left_keys_, left_roll_);
    out.right = build_side(*right_, options_.prefix[1], right_pos, right_keys_, right_roll_);

    // The materialized side should be the smaller file. Output identity and
    // column order do not depend on this choice.
    out.build_left = kind_ == JoinKind::Inner && left_bytes > 0 && left_bytes < right_bytes;

    for (auto pos : selected) {
        if (pos < n_left) {
            auto it = std::lower_bound(left_pos.begin(), left_pos.end(), pos);
            out.write_index.push_back(static_cast<std::size_t>(it - left_pos.begin()));
        } else {
            auto it = std::lower_bound(right_pos.begin(), right_pos.end(), pos - n_left);
            out.write_index.push_back(left_pos.size() +
                                      static_cast<std::size_t>(it - right_pos.begin()));
        }
        out.header.push_back(names[pos]);
    }

    spdlog::debug("{} join layout: left carries {}, right carries {}, build side {}",
                  join_kind_name(kind_), out.left.carried.size(), out.right.carried.size(),
                  out.build_left ? "left" : "right");
    return out;
}

}  // namespace oryx::plan
