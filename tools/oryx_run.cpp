#include <oryx/oryx.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace {

auto aggregator_named(const std::string& name) -> oryx::plan::Aggregator {
    static const std::map<std::string, oryx::plan::Aggregator (*)()> kBuiltins{
        {"sum", oryx::agg::sum},     {"mean", oryx::agg::mean},   {"min", oryx::agg::min},
        {"max", oryx::agg::max},     {"count", oryx::agg::count}, {"first", oryx::agg::first},
        {"last", oryx::agg::last},
    };
    auto it = kBuiltins.find(name);
    if (it == kBuiltins.end()) {
        throw oryx::SchemaError(fmt::format("unknown aggregate function: {}", name));
    }
    return it->second();
}

/// Split `name:rest` at the first colon.
auto split_pair(const std::string& text, const char* what) -> std::pair<std::string, std::string> {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        throw oryx::SchemaError(fmt::format("malformed {} '{}'", what, text));
    }
    return {text.substr(0, colon), text.substr(colon + 1)};
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"oryx_run: evaluate a pipeline over a delimited file"};
    app.set_version_flag("--version", "oryx_run 0.1.0");

    std::string input_path;
    std::string output_path;
    bool no_header = false;
    char separator = ',';
    std::size_t batch_size = 300;
    std::vector<std::string> types;
    std::vector<std::string> select;
    std::vector<std::string> exclude;
    std::vector<std::string> group_by;
    std::vector<std::string> aggregates;
    std::vector<std::string> sort_spec;
    std::size_t workers = 1;
    bool unordered = false;
    bool raise = false;
    std::size_t head = 0;
    bool preview = false;
    bool verbose = false;

    app.add_option("input", input_path, "Input delimited file")->required();
    app.add_option("output", output_path, "Output file");
    app.add_flag("--no-header", no_header, "The first record is data, not column names");
    app.add_option("--separator", separator, "Field separator (default: ',')");
    app.add_option("--batch-size", batch_size, "Records read per batch (default: 300)");
    app.add_option("--type", types, "Column type as col:tag, e.g. Salary:int or Day:date")
        ->take_all();
    app.add_option("--select", select, "Output columns to keep")->delimiter(',');
    auto* exclude_opt =
        app.add_option("--exclude", exclude, "Output columns to drop")->delimiter(',');
    app.get_option("--select")->excludes(exclude_opt);
    app.add_option("--group-by", group_by, "Group-by key columns")->delimiter(',');
    app.add_option("--agg", aggregates, "Aggregate as func:col, e.g. mean:Salary")->take_all();
    app.add_option("--sort", sort_spec, "Sort order, e.g. +,Salary,-,Name")->delimiter(',');
    app.add_option("--workers", workers, "Parallel workers, 1-8 (default: 1)");
    app.add_flag("--unordered", unordered, "Allow output rows in any order");
    app.add_flag("--raise", raise, "Abort on the first failing row");
    app.add_option("--head", head, "Print the first N raw records and exit");
    app.add_flag("--preview", preview, "Print a dry run over the first rows and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        auto frame = oryx::DataFrame::from_csv(
            input_path,
            oryx::TableOptions{
                .have_header = !no_header, .batch_size = batch_size, .separator = separator});

        if (head > 0) {
            fmt::print("{}\n", fmt::join(frame.col_names(), ","));
            for (const auto& row : frame.head(head)) {
                fmt::print("{}\n", fmt::join(row, ","));
            }
            return 0;
        }

        for (const auto& entry : types) {
            auto [column, tag] = split_pair(entry, "--type");
            frame.set_type(tag, column);
        }

        if (!sort_spec.empty()) {
            if (output_path.empty()) {
                fmt::print(stderr, "oryx_run: --sort requires an output path\n");
                return 1;
            }
            frame.sort(sort_spec, output_path);
            return 0;
        }

        if (!group_by.empty()) {
            std::vector<oryx::plan::KeySpec> keys(group_by.begin(), group_by.end());
            frame.group_by(keys);
        }
        for (const auto& entry : aggregates) {
            auto [func, column] = split_pair(entry, "--agg");
            frame.aggregate(aggregator_named(func), {column});
        }

        if (preview) {
            fmt::print("{}", oryx::runtime::render_preview(frame.preview()));
            return 0;
        }
        if (output_path.empty()) {
            fmt::print(stderr, "oryx_run: an output path is required\n");
            return 1;
        }

        oryx::ComputeOptions options{.num_workers = workers,
                                     .output_path = output_path,
                                     .raise_on_error = raise,
                                     .preserve_order = !unordered};
        if (!select.empty()) {
            options.select = select;
        }
        if (!exclude.empty()) {
            options.exclude = exclude;
        }
        auto report = frame.compute(options);
        fmt::print("{} row(s) read, {} row(s) written, {} failure(s)\n", report.rows_read,
                   report.rows_written, report.failures.size());
        return report.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        fmt::print(stderr, "oryx_run: {}\n", e.what());
        return 1;
    }
}
