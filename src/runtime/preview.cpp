#include <oryx/runtime/evaluator.hpp>
#include <oryx/runtime/preview.hpp>
#include <oryx/runtime/row_source.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace oryx::runtime {

namespace {

/// Evaluated rows of the first `sample_size` records that pass the filters.
auto sample_rows(const plan::TablePlan& table, std::size_t sample_size)
    -> std::expected<std::vector<Row>, std::string> {
    auto source = CsvRowSource::open(table.path, table.options);
    if (!source) {
        return std::unexpected(source.error());
    }
    RowEvaluator evaluator(table);
    std::vector<Row> rows;
    for (std::size_t i = 0; i < sample_size; ++i) {
        auto record = (*source)->next();
        if (!record) {
            return std::unexpected(record.error());
        }
        if (!*record) {
            break;
        }
        try {
            if (auto row = evaluator.evaluate(**record)) {
                rows.push_back(std::move(*row));
            }
        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("record {}: {}", (*record)->id, e.what()));
        }
    }
    return rows;
}

auto to_strings(const Row& row) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(row.size());
    for (const auto& value : row) {
        out.push_back(to_text(value));
    }
    return out;
}

auto preview_select(const plan::SelectPlan& plan, std::size_t sample, std::size_t limit)
    -> std::expected<PreviewResult, std::string> {
    auto rows = sample_rows(plan.table, sample);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    PreviewResult result{.header = plan.header};
    for (const auto& row : *rows) {
        if (result.rows.size() >= limit) {
            break;
        }
        result.rows.push_back(to_strings(project(row, plan.output)));
    }
    return result;
}

auto preview_aggregate(const plan::AggregatePlan& plan, std::size_t sample, std::size_t limit,
                       bool format) -> std::expected<PreviewResult, std::string> {
    auto rows = sample_rows(plan.table, sample);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    const auto& layout = plan.layout;
    GroupIndex index(layout);
    std::vector<std::vector<Row>> groups;
    try {
        for (const auto& row : *rows) {
            auto carried = project(row, layout.carried);
            auto g = index.assign(carried);
            if (g >= groups.size()) {
                groups.resize(g + 1);
            }
            groups[g].push_back(std::move(carried));
        }
        PreviewResult result{.header = layout.header};
        if (!layout.grouped && groups.empty()) {
            result.rows.push_back(to_strings(reduce_group(layout, {}, {}, format)));
        }
        for (std::size_t g = 0; g < groups.size() && result.rows.size() < limit; ++g) {
            result.rows.push_back(to_strings(reduce_group(layout, index.key(g), groups[g], format)));
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

auto preview_join(const plan::JoinPlan& plan, std::size_t sample, std::size_t limit,
                  bool format) -> std::expected<PreviewResult, std::string> {
    const auto& layout = plan.layout;
    const bool asof =
        layout.kind == plan::JoinKind::AsofForward || layout.kind == plan::JoinKind::AsofBackward;
    auto build_rows = sample_rows(layout.build_left ? plan.left : plan.right, sample);
    if (!build_rows) {
        return std::unexpected(build_rows.error());
    }
    auto probe_rows = sample_rows(layout.build_left ? plan.right : plan.left, sample);
    if (!probe_rows) {
        return std::unexpected(probe_rows.error());
    }
    try {
        JoinIndex index(layout.build_left ? layout.left : layout.right, asof);
        for (const auto& row : *build_rows) {
            index.add(row);
        }
        index.seal();
        JoinProbe probe(layout, index, format);
        PreviewResult result{.header = layout.header};
        for (const auto& row : *probe_rows) {
            for (const auto& out : probe.emit(row)) {
                if (result.rows.size() >= limit) {
                    return result;
                }
                result.rows.push_back(to_strings(out));
            }
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

}  // namespace

auto preview(const plan::Plan& plan, std::size_t sample_size, std::size_t return_size,
             bool format) -> std::expected<PreviewResult, std::string> {
    return std::visit(
        [&](const auto& p) -> std::expected<PreviewResult, std::string> {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, plan::SelectPlan>) {
                return preview_select(p, sample_size, return_size);
            } else if constexpr (std::is_same_v<T, plan::AggregatePlan>) {
                return preview_aggregate(p, sample_size, return_size, format);
            } else {
                return preview_join(p, sample_size, return_size, format);
            }
        },
        plan);
}

auto render_preview(const PreviewResult& result) -> std::string {
    std::vector<std::size_t> widths(result.header.size(), 0);
    for (std::size_t c = 0; c < result.header.size(); ++c) {
        widths[c] = result.header[c].size();
        for (const auto& row : result.rows) {
            if (c < row.size()) {
                widths[c] = std::max(widths[c], row[c].size());
            }
        }
    }
    auto line = [&](const std::vector<std::string>& cells) {
        std::string out;
        for (std::size_t c = 0; c < widths.size(); ++c) {
            if (c > 0) {
                out += "  ";
            }
            out += fmt::format("{:<{}}", c < cells.size() ? cells[c] : std::string(), widths[c]);
        }
        while (!out.empty() && out.back() == ' ') {
            out.pop_back();
        }
        out.push_back('\n');
        return out;
    };
    std::string out = line(result.header);
    for (const auto& row : result.rows) {
        out += line(row);
    }
    return out;
}

}  // namespace oryx::runtime
