#include <oryx/core/error.hpp>
#include <oryx/frame/dataframe.hpp>
#include <oryx/plan/aggregate.hpp>
#include <oryx/plan/sort.hpp>
#include <oryx/runtime/row_source.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace oryx {

namespace {

/// Records read by the dry run that follows every builder call.
constexpr std::size_t kDryRunRows = 10;

}  // namespace

DataFrame::DataFrame(std::filesystem::path path, TableOptions options, plan::ColumnCatalog catalog)
    : path_(std::move(path)), options_(options), state_{.catalog = std::move(catalog)} {}

auto DataFrame::from_csv(const std::filesystem::path& path, TableOptions options) -> DataFrame {
    if (options.batch_size == 0) {
        throw SchemaError("batch_size must be positive");
    }
    auto header = runtime::read_header(path, options);
    if (!header) {
        throw OperationError(
            fmt::format("cannot open table {} (original error: {})", path.string(), header.error()));
    }
    spdlog::debug("opened {} with {} column(s)", path.string(), header->size());
    return DataFrame(path, options, plan::ColumnCatalog(*header));
}

template <typename Fn>
void DataFrame::mutate(std::string_view context, Fn&& fn) {
    State saved = state_;
    std::expected<runtime::PreviewResult, std::string> dry;
    try {
        fn(state_);
        dry = runtime::preview(plan(), kDryRunRows, kDryRunRows, true);
    } catch (...) {
        state_ = std::move(saved);
        throw;
    }
    if (!dry) {
        state_ = std::move(saved);
        throw OperationError(fmt::format("{} (original error: {})", context, dry.error()));
    }
    spdlog::debug("{} on {}", context, path_.string());
}

// ─── Builder ────────────────────────────────────────────────────────────────

auto DataFrame::operate(plan::UnaryFn fn, std::string_view column) -> DataFrame& {
    mutate(fmt::format("operate({})", column),
           [&](State& s) { s.catalog.operate(std::move(fn), column); });
    return *this;
}

auto DataFrame::operate(plan::RowFn fn, const std::vector<std::string>& columns,
                        std::string_view new_column) -> DataFrame& {
    mutate(fmt::format("operate([{}] -> {})", fmt::join(columns, ", "), new_column),
           [&](State& s) { s.catalog.operate(std::move(fn), columns, new_column); });
    return *this;
}

auto DataFrame::set_type(std::string_view tag, std::string_view column) -> DataFrame& {
    mutate(fmt::format("set_type({}, {})", tag, column),
           [&](State& s) { s.catalog.set_type(tag, column); });
    return *this;
}

auto DataFrame::set_parser(Parser parser, std::string_view column) -> DataFrame& {
    mutate(fmt::format("set_parser({})", column),
           [&](State& s) { s.catalog.set_parser(std::move(parser), column); });
    return *this;
}

auto DataFrame::filter(const std::vector<std::string>& columns, plan::Predicate predicate)
    -> DataFrame& {
    if (!predicate) {
        throw SchemaError("filter requires a callable predicate");
    }
    mutate(fmt::format("filter([{}])", fmt::join(columns, ", ")), [&](State& s) {
        plan::FilterSpec spec{.predicate = std::move(predicate),
                              .position = s.catalog.pipeline().size()};
        for (const auto& name : columns) {
            spec.columns.push_back(s.catalog.slot_of(name));
        }
        s.rows.add_filter(std::move(spec));
    });
    return *this;
}

auto DataFrame::group_by(const std::vector<plan::KeySpec>& keys) -> DataFrame& {
    if (keys.empty()) {
        throw SchemaError("group_by requires at least one key");
    }
    std::vector<std::string> names;
    for (const auto& key : keys) {
        names.push_back(key.column);
    }
    mutate(fmt::format("group_by([{}])", fmt::join(names, ", ")), [&](State& s) {
        std::vector<plan::GroupKey> resolved;
        std::unordered_set<std::size_t> seen;
        for (const auto& key : keys) {
            auto slot = s.catalog.slot_of(key.column);
            if (!seen.insert(slot).second) {
                throw SchemaError(fmt::format("duplicate group-by key: {}", key.column));
            }
            resolved.push_back(plan::GroupKey{.collation = key.collation, .column = slot});
        }
        s.rows.set_group_by(std::move(resolved));
    });
    return *this;
}

auto DataFrame::aggregate(const plan::Aggregator& func, const std::vector<std::string>& columns,
                          const std::vector<std::string>& new_names) -> DataFrame& {
    if (!func.reduce) {
        throw SchemaError("aggregate requires a callable reduction");
    }
    if (columns.empty()) {
        throw SchemaError("aggregate requires at least one column");
    }
    if (!new_names.empty() && new_names.size() != columns.size()) {
        throw SchemaError(fmt::format("aggregate got {} column(s) but {} new name(s)",
                                      columns.size(), new_names.size()));
    }
    mutate(fmt::format("aggregate({}, [{}])", func.name, fmt::join(columns, ", ")),
           [&](State& s) {
               std::unordered_set<std::string> taken;
               for (const auto& name : s.catalog.col_names()) {
                   taken.insert(name);
               }
               for (const auto& spec : s.rows.aggregates()) {
                   taken.insert(spec.name);
               }
               for (std::size_t i = 0; i < columns.size(); ++i) {
                   auto slot = s.catalog.slot_of(columns[i]);
                   auto name = new_names.empty() ? fmt::format("{}({})", func.name, columns[i])
                                                 : new_names[i];
                   if (name.empty()) {
                       throw SchemaError("aggregate names must not be empty");
                   }
                   if (!taken.insert(name).second) {
                       throw SchemaError(fmt::format(
                           "aggregate name '{}' must not be an existing column name", name));
                   }
                   s.rows.add_aggregate(
                       plan::AggregateSpec{.func = func, .source = slot, .name = name});
               }
           });
    return *this;
}

auto DataFrame::delete_col(const std::vector<std::string>& columns) -> DataFrame& {
    mutate(fmt::format("delete_col([{}])", fmt::join(columns, ", ")),
           [&](State& s) { s.catalog.delete_cols(columns); });
    return *this;
}

auto DataFrame::select_col(const std::vector<std::string>& columns) -> DataFrame& {
    mutate(fmt::format("select_col([{}])", fmt::join(columns, ", ")), [&](State& s) {
        std::unordered_set<std::string> keep;
        for (const auto& name : columns) {
            s.catalog.slot_of(name);
            keep.insert(name);
        }
        std::vector<std::string> doomed;
        for (const auto& name : s.catalog.col_names()) {
            if (!keep.contains(name)) {
                doomed.push_back(name);
            }
        }
        s.catalog.delete_cols(doomed);
    });
    return *this;
}

auto DataFrame::reorder_col(const std::vector<std::string>& names) -> DataFrame& {
    mutate(fmt::format("reorder_col([{}])", fmt::join(names, ", ")),
           [&](State& s) { s.catalog.reorder_cols(names); });
    return *this;
}

auto DataFrame::rename_col(const std::vector<std::string>& names) -> DataFrame& {
    mutate(fmt::format("rename_col([{}])", fmt::join(names, ", ")),
           [&](State& s) { s.catalog.rename_cols(names); });
    return *this;
}

// ─── Queries ────────────────────────────────────────────────────────────────

auto DataFrame::col_names() const -> std::vector<std::string> {
    if (state_.rows.is_aggregate()) {
        return plan::GroupAggregateIndexer(state_.catalog, state_.rows).output_names();
    }
    return state_.catalog.col_names();
}

auto DataFrame::col_types() const -> std::vector<std::pair<std::string, ColumnType>> {
    if (!state_.rows.is_aggregate()) {
        return state_.catalog.col_types();
    }
    std::vector<std::pair<std::string, ColumnType>> types;
    for (const auto& key : state_.rows.group_by()) {
        const auto& info = state_.catalog.slot(key.column);
        types.emplace_back(info.name, key.collation ? ColumnType::Raw : info.type);
    }
    for (const auto& spec : state_.rows.aggregates()) {
        types.emplace_back(spec.name, ColumnType::Raw);
    }
    return types;
}

auto DataFrame::col_index() const -> std::vector<std::size_t> {
    return state_.catalog.col_index();
}

auto DataFrame::head(std::size_t n) const -> std::vector<std::vector<std::string>> {
    auto source = runtime::CsvRowSource::open(path_, options_);
    if (!source) {
        throw OperationError(fmt::format("head failed (original error: {})", source.error()));
    }
    std::vector<std::vector<std::string>> rows;
    while (rows.size() < n) {
        auto row = (*source)->next();
        if (!row) {
            throw OperationError(fmt::format("head failed (original error: {})", row.error()));
        }
        if (!*row) {
            break;
        }
        rows.push_back(std::move((*row)->fields));
    }
    return rows;
}

auto DataFrame::preview(std::size_t sample_size, std::size_t return_size, bool format) const
    -> runtime::PreviewResult {
    auto result = runtime::preview(plan(std::nullopt, format), sample_size, return_size, format);
    if (!result) {
        throw OperationError(fmt::format("preview failed (original error: {})", result.error()));
    }
    return std::move(*result);
}

auto DataFrame::plan(const std::optional<std::vector<std::string>>& select,
                     bool with_formatters) const -> plan::Plan {
    if (state_.rows.is_aggregate()) {
        return plan::make_aggregate_plan(path_, options_, state_.catalog, state_.rows, select);
    }
    return plan::make_select_plan(path_, options_, state_.catalog, state_.rows, select,
                                  with_formatters);
}

auto DataFrame::compute(const ComputeOptions& options, runtime::ExecutionBackend* backend) const
    -> runtime::ExecutionReport {
    auto select = resolve_selection(options, col_names());
    return run_plan(plan(select), options, backend);
}

auto DataFrame::sort(const std::vector<std::string>& spec, const std::filesystem::path& output,
                     runtime::SortOptions options) const -> std::size_t {
    auto keys = plan::parse_sort_spec(spec, state_.catalog);
    options.table = options_;
    runtime::ExternalSorter sorter(plan::RowComparator(std::move(keys)), std::move(options));
    auto written = sorter.sort_file(path_, output);
    if (!written) {
        throw OperationError(
            fmt::format("sort [{}] failed (original error: {})", fmt::join(spec, ","),
                        written.error()));
    }
    spdlog::info("sorted {} row(s) of {} into {}", *written, path_.string(), output.string());
    return *written;
}

auto DataFrame::file_size() const -> std::uintmax_t {
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    return ec ? 0 : size;
}

// ─── Evaluation helpers ─────────────────────────────────────────────────────

auto resolve_selection(const ComputeOptions& options, const std::vector<std::string>& names)
    -> std::optional<std::vector<std::string>> {
    if (options.select && options.exclude) {
        throw SchemaError("select and exclude are mutually exclusive");
    }
    if (options.select) {
        if (options.select->empty()) {
            throw SchemaError("must select at least one column");
        }
        return options.select;
    }
    if (!options.exclude) {
        return std::nullopt;
    }
    for (const auto& name : *options.exclude) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            throw SchemaError(fmt::format("cannot exclude unknown column: {} (available: {})",
                                          name, fmt::join(names, ", ")));
        }
    }
    std::vector<std::string> kept;
    for (const auto& name : names) {
        if (std::find(options.exclude->begin(), options.exclude->end(), name) ==
            options.exclude->end()) {
            kept.push_back(name);
        }
    }
    if (kept.empty()) {
        throw SchemaError("must select at least one column");
    }
    return kept;
}

auto execution_options(const ComputeOptions& options) -> runtime::ExecutionOptions {
    if (options.num_workers == 0 || options.num_workers > kMaxWorkers) {
        throw SchemaError(fmt::format("num_workers must be between 1 and {}, got {}",
                                      kMaxWorkers, options.num_workers));
    }
    if (options.output_path.empty()) {
        throw SchemaError("compute requires an output path");
    }
    return runtime::ExecutionOptions{.num_workers = options.num_workers,
                                     .output_path = options.output_path,
                                     .raise_on_error = options.raise_on_error,
                                     .preserve_order = options.preserve_order,
                                     .work_dir = options.work_dir};
}

auto run_plan(const plan::Plan& plan, const ComputeOptions& options,
              runtime::ExecutionBackend* backend) -> runtime::ExecutionReport {
    auto exec = execution_options(options);
    runtime::LocalBackend local;
    if (backend == nullptr) {
        backend = &local;
    }
    auto report = backend->execute(plan, exec);
    if (!report) {
        throw OperationError(
            fmt::format("evaluation failed (original error: {})", report.error()));
    }
    for (const auto& failure : report->failures) {
        spdlog::warn("{} record {} failed: {}", failure.source, failure.row_id, failure.message);
    }
    return std::move(*report);
}

}  // namespace oryx
