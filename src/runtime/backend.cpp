#include <oryx/core/options.hpp>
#include <oryx/runtime/backend.hpp>
#include <oryx/runtime/csv.hpp>
#include <oryx/runtime/evaluator.hpp>
#include <oryx/runtime/row_source.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace oryx::runtime {

namespace {

template <typename Item>
using RecordFn = std::function<void(const SourceRow&, std::vector<Item>&)>;

template <typename Item>
using SinkFn = std::function<void(std::vector<Item>&)>;

template <typename Item>
struct BatchOutcome {
    std::vector<Item> items;
    std::vector<RowFailure> failures;
    std::optional<std::string> fatal;
};

/// Streams a table through `fn` in waves of one batch per worker and hands
/// each batch's items to `sink`. In ordered mode sinks run on the calling
/// thread in batch order; otherwise each worker sinks its batch under a lock
/// as soon as it finishes.
template <typename Item>
auto stream_table(const plan::TablePlan& table, const ExecutionOptions& options,
                  const RecordFn<Item>& fn, const SinkFn<Item>& sink, ExecutionReport& report)
    -> std::expected<void, std::string> {
    auto source = CsvRowSource::open(table.path, table.options);
    if (!source) {
        return std::unexpected(source.error());
    }
    const std::size_t workers = std::clamp<std::size_t>(options.num_workers, 1, kMaxWorkers);
    const std::string origin = table.path.string();
    std::mutex sink_mutex;

    bool exhausted = false;
    while (!exhausted) {
        std::vector<std::vector<SourceRow>> wave;
        while (wave.size() < workers) {
            auto batch = (*source)->next_batch();
            if (!batch) {
                return std::unexpected(batch.error());
            }
            if (batch->empty()) {
                exhausted = true;
                break;
            }
            report.rows_read += batch->size();
            wave.push_back(std::move(*batch));
        }
        if (wave.empty()) {
            break;
        }

        std::vector<BatchOutcome<Item>> outcomes(wave.size());
        auto run = [&](std::size_t b) {
            auto& outcome = outcomes[b];
            for (const auto& row : wave[b]) {
                try {
                    fn(row, outcome.items);
                } catch (const std::exception& e) {
                    if (options.raise_on_error) {
                        outcome.fatal = fmt::format("{} record {}: {}", origin, row.id, e.what());
                        return;
                    }
                    outcome.failures.push_back(
                        RowFailure{.row_id = row.id, .source = origin, .message = e.what()});
                }
            }
            if (!options.preserve_order) {
                std::lock_guard<std::mutex> lock(sink_mutex);
                sink(outcome.items);
            }
        };

        if (wave.size() == 1) {
            run(0);
        } else {
            std::vector<std::thread> threads;
            threads.reserve(wave.size());
            for (std::size_t b = 0; b < wave.size(); ++b) {
                threads.emplace_back(run, b);
            }
            for (auto& th : threads) {
                th.join();
            }
        }

        for (auto& outcome : outcomes) {
            if (outcome.fatal) {
                return std::unexpected(*outcome.fatal);
            }
        }
        for (auto& outcome : outcomes) {
            if (options.preserve_order) {
                sink(outcome.items);
            }
            report.failures.insert(report.failures.end(),
                                   std::make_move_iterator(outcome.failures.begin()),
                                   std::make_move_iterator(outcome.failures.end()));
        }
    }
    return {};
}

auto open_output(const plan::Plan& plan, const ExecutionOptions& options, char separator)
    -> std::expected<CsvWriter, std::string> {
    if (options.output_path.empty()) {
        return std::unexpected("no output path given");
    }
    auto writer = CsvWriter::open(options.output_path, separator);
    if (writer) {
        writer->write(plan::plan_header(plan));
    }
    return writer;
}

/// Per-group partition files under a private scratch directory.
class GroupSpill {
   public:
    explicit GroupSpill(const std::filesystem::path& work_dir)
        : dir_(work_dir /
               fmt::format("groups-{}-{}",
                           std::chrono::steady_clock::now().time_since_epoch().count(),
                           counter_.fetch_add(1))) {}

    GroupSpill(const GroupSpill&) = delete;
    auto operator=(const GroupSpill&) -> GroupSpill& = delete;

    ~GroupSpill() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto prepare() -> std::expected<void, std::string> {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return std::unexpected(
                fmt::format("cannot create work directory {}: {}", dir_.string(), ec.message()));
        }
        return {};
    }

    void append(std::size_t group, const Row& carried) {
        if (group >= pending_.size()) {
            pending_.resize(group + 1);
        }
        std::vector<std::string> fields;
        fields.reserve(carried.size());
        for (const auto& value : carried) {
            fields.push_back(encode_value(value));
        }
        pending_[group] += format_csv_row(fields, ',');
        pending_[group].push_back('\n');
    }

    /// Append buffered rows to their partition files.
    auto flush() -> std::expected<void, std::string> {
        for (std::size_t g = 0; g < pending_.size(); ++g) {
            if (pending_[g].empty()) {
                continue;
            }
            std::ofstream out(file_of(g), std::ios::app);
            out << pending_[g];
            if (!out) {
                return std::unexpected(fmt::format("failed writing {}", file_of(g).string()));
            }
            pending_[g].clear();
        }
        ++flushes_;
        return {};
    }

    auto load(std::size_t group) const -> std::expected<std::vector<Row>, std::string> {
        std::vector<Row> rows;
        std::ifstream in(file_of(group));
        if (!in) {
            return rows;
        }
        std::string text;
        while (read_record_text(in, text)) {
            auto records = parse_csv_records(text, ',');
            if (!records) {
                return std::unexpected(records.error());
            }
            for (const auto& record : *records) {
                Row row;
                row.reserve(record.size());
                for (const auto& field : record) {
                    auto value = decode_value(field);
                    if (!value) {
                        return std::unexpected(
                            fmt::format("corrupt partition file {}", file_of(group).string()));
                    }
                    row.push_back(std::move(*value));
                }
                rows.push_back(std::move(row));
            }
        }
        return rows;
    }

    [[nodiscard]] auto flushes() const noexcept -> std::size_t { return flushes_; }

   private:
    auto file_of(std::size_t group) const -> std::filesystem::path {
        return dir_ / fmt::format("group-{}.csv", group);
    }

    static inline std::atomic<std::uint64_t> counter_{0};

    std::filesystem::path dir_;
    std::vector<std::string> pending_;
    std::size_t flushes_ = 0;
};

auto run_select(const plan::SelectPlan& plan, const ExecutionOptions& options,
                const plan::Plan& whole) -> std::expected<ExecutionReport, std::string> {
    ExecutionReport report;
    auto writer = open_output(whole, options, plan.table.options.separator);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    RowEvaluator evaluator(plan.table);
    RecordFn<Row> fn = [&](const SourceRow& source, std::vector<Row>& out) {
        if (auto row = evaluator.evaluate(source)) {
            out.push_back(project(*row, plan.output));
        }
    };
    SinkFn<Row> sink = [&](std::vector<Row>& rows) {
        for (const auto& row : rows) {
            writer->write(row);
        }
        report.rows_written += rows.size();
    };
    if (auto ok = stream_table(plan.table, options, fn, sink, report); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = writer->close(); !ok) {
        return std::unexpected(ok.error());
    }
    return report;
}

auto run_aggregate(const plan::AggregatePlan& plan, const ExecutionOptions& options,
                   const plan::Plan& whole) -> std::expected<ExecutionReport, std::string> {
    ExecutionReport report;
    const auto& layout = plan.layout;
    GroupSpill spill(options.work_dir);
    if (auto ok = spill.prepare(); !ok) {
        return std::unexpected(ok.error());
    }

    RowEvaluator evaluator(plan.table);
    GroupIndex groups(layout);
    using Keyed = std::pair<std::vector<Value>, Row>;
    RecordFn<Keyed> fn = [&](const SourceRow& source, std::vector<Keyed>& out) {
        if (auto row = evaluator.evaluate(source)) {
            auto carried = project(*row, layout.carried);
            auto key = groups.key_of(carried);
            out.emplace_back(std::move(key), std::move(carried));
        }
    };
    // Each batch is appended to the partition files as soon as it is sunk.
    std::expected<void, std::string> flushed;
    SinkFn<Keyed> sink = [&](std::vector<Keyed>& items) {
        for (auto& [key, carried] : items) {
            spill.append(groups.assign_key(std::move(key)), carried);
        }
        if (flushed) {
            flushed = spill.flush();
        }
    };
    if (auto ok = stream_table(plan.table, options, fn, sink, report); !ok) {
        return std::unexpected(ok.error());
    }
    if (!flushed) {
        return std::unexpected(flushed.error());
    }
    spdlog::debug("aggregate spilled {} group(s) over {} flush(es)", groups.size(),
                  spill.flushes());

    auto writer = open_output(whole, options, plan.table.options.separator);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    auto reduce_one = [&](std::size_t g, const std::vector<Value>& key,
                          const std::vector<Row>& rows) -> std::expected<void, std::string> {
        try {
            writer->write(reduce_group(layout, key, rows));
            ++report.rows_written;
        } catch (const std::exception& e) {
            if (options.raise_on_error) {
                return std::unexpected(fmt::format("group {}: {}", g, e.what()));
            }
            report.failures.push_back(
                RowFailure{.row_id = g, .source = "group", .message = e.what()});
        }
        return {};
    };

    if (!layout.grouped && groups.size() == 0) {
        if (auto ok = reduce_one(0, {}, {}); !ok) {
            return std::unexpected(ok.error());
        }
    }
    for (std::size_t g = 0; g < groups.size(); ++g) {
        auto rows = spill.load(g);
        if (!rows) {
            return std::unexpected(rows.error());
        }
        if (auto ok = reduce_one(g, groups.key(g), *rows); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = writer->close(); !ok) {
        return std::unexpected(ok.error());
    }
    return report;
}

auto run_join(const plan::JoinPlan& plan, const ExecutionOptions& options,
              const plan::Plan& whole) -> std::expected<ExecutionReport, std::string> {
    ExecutionReport report;
    const auto& layout = plan.layout;
    const bool asof =
        layout.kind == plan::JoinKind::AsofForward || layout.kind == plan::JoinKind::AsofBackward;
    const auto& build_table = layout.build_left ? plan.left : plan.right;
    const auto& probe_table = layout.build_left ? plan.right : plan.left;
    const auto& build_side = layout.build_left ? layout.left : layout.right;

    // Build stage: runs to completion before any probe row is read.
    JoinIndex index(build_side, asof);
    RowEvaluator build_eval(build_table);
    using Entry = std::pair<std::vector<Value>, JoinEntry>;
    RecordFn<Entry> build_fn = [&](const SourceRow& source, std::vector<Entry>& out) {
        if (auto row = build_eval.evaluate(source)) {
            if (auto entry = index.entry_of(*row)) {
                out.push_back(std::move(*entry));
            }
        }
    };
    SinkFn<Entry> build_sink = [&](std::vector<Entry>& entries) {
        for (auto& [key, entry] : entries) {
            index.insert(std::move(key), std::move(entry));
        }
    };
    if (auto ok = stream_table(build_table, options, build_fn, build_sink, report); !ok) {
        return std::unexpected(ok.error());
    }
    index.seal();
    spdlog::debug("{} join: built {} row(s) from {}", plan::join_kind_name(layout.kind),
                  index.size(), build_table.path.string());

    auto writer = open_output(whole, options, plan.left.options.separator);
    if (!writer) {
        return std::unexpected(writer.error());
    }
    RowEvaluator probe_eval(probe_table);
    JoinProbe probe(layout, index);
    RecordFn<Row> probe_fn = [&](const SourceRow& source, std::vector<Row>& out) {
        if (auto row = probe_eval.evaluate(source)) {
            auto rows = probe.emit(*row);
            std::move(rows.begin(), rows.end(), std::back_inserter(out));
        }
    };
    SinkFn<Row> probe_sink = [&](std::vector<Row>& rows) {
        for (const auto& row : rows) {
            writer->write(row);
        }
        report.rows_written += rows.size();
    };
    if (auto ok = stream_table(probe_table, options, probe_fn, probe_sink, report); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = writer->close(); !ok) {
        return std::unexpected(ok.error());
    }
    return report;
}

}  // namespace

auto default_work_dir() -> std::filesystem::path {
    if (const char* env = std::getenv("ORYX_WORK_DIR"); env != nullptr && *env != '\0') {
        return env;
    }
    return std::filesystem::temp_directory_path() / "oryx";
}

auto LocalBackend::execute(const plan::Plan& plan, const ExecutionOptions& options)
    -> std::expected<ExecutionReport, std::string> {
    ExecutionOptions resolved = options;
    if (resolved.work_dir.empty()) {
        resolved.work_dir = default_work_dir();
    }
    if (resolved.num_workers == 0 || resolved.num_workers > kMaxWorkers) {
        return std::unexpected(
            fmt::format("num_workers must be between 1 and {}, got {}", kMaxWorkers,
                        resolved.num_workers));
    }

    spdlog::info("evaluating into {} with {} worker(s)", resolved.output_path.string(),
                 resolved.num_workers);
    auto report = std::visit(
        [&](const auto& p) -> std::expected<ExecutionReport, std::string> {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, plan::SelectPlan>) {
                return run_select(p, resolved, plan);
            } else if constexpr (std::is_same_v<T, plan::AggregatePlan>) {
                return run_aggregate(p, resolved, plan);
            } else {
                return run_join(p, resolved, plan);
            }
        },
        plan);
    if (report) {
        spdlog::info("read {} row(s), wrote {} row(s), {} failure(s)", report->rows_read,
                     report->rows_written, report->failures.size());
    }
    return report;
}

}  // namespace oryx::runtime
