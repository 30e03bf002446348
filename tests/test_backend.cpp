#include <oryx/oryx.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace oryx;

namespace {

auto tmp(const std::string& name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto write_file(const std::string& name, const std::string& text) -> std::filesystem::path {
    auto path = tmp(name);
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

auto read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

auto numbers(int rows) -> std::filesystem::path {
    std::string text = "n,bucket\n";
    for (int i = 0; i < rows; ++i) {
        text += std::to_string(i) + ",b" + std::to_string(i % 3) + "\n";
    }
    return write_file("oryx_backend_numbers_" + std::to_string(rows) + ".csv", text);
}

auto as_int(std::span<const Value> v) -> std::int64_t { return std::get<std::int64_t>(v[0]); }

/// Forwards to a LocalBackend and records what it was asked to run.
class RecordingBackend final : public runtime::ExecutionBackend {
   public:
    auto execute(const plan::Plan& plan, const runtime::ExecutionOptions& options)
        -> std::expected<runtime::ExecutionReport, std::string> override {
        ++calls;
        workers = options.num_workers;
        header = plan::plan_header(plan);
        return local_.execute(plan, options);
    }

    int calls = 0;
    std::size_t workers = 0;
    std::vector<std::string> header;

   private:
    runtime::LocalBackend local_;
};

}  // namespace

// ─── Select ─────────────────────────────────────────────────────────────────

TEST_CASE("Parallel ordered output matches a single worker", "[backend]") {
    auto df = DataFrame::from_csv(numbers(101), TableOptions{.batch_size = 4});
    df.set_type("int", "n").operate(
        [](std::span<const Value> v) -> Value { return as_int(v) * as_int(v); }, {"n"}, "sq");

    auto serial = tmp("oryx_backend_serial.csv");
    auto parallel = tmp("oryx_backend_parallel.csv");
    auto one = df.compute(ComputeOptions{.num_workers = 1, .output_path = serial});
    auto many = df.compute(ComputeOptions{.num_workers = 8, .output_path = parallel});

    REQUIRE(one.rows_read == 101);
    REQUIRE(many.rows_written == 101);
    REQUIRE(read_lines(serial) == read_lines(parallel));
    REQUIRE(read_lines(parallel)[11] == "10,b1,100");
}

TEST_CASE("Unordered output holds the same rows", "[backend]") {
    auto df = DataFrame::from_csv(numbers(57), TableOptions{.batch_size = 5});
    auto ordered = tmp("oryx_backend_ordered.csv");
    auto unordered = tmp("oryx_backend_unordered.csv");
    df.compute(ComputeOptions{.num_workers = 3, .output_path = ordered});
    df.compute(ComputeOptions{.num_workers = 3, .output_path = unordered,
                              .preserve_order = false});

    auto a = read_lines(ordered);
    auto b = read_lines(unordered);
    REQUIRE(b.front() == "n,bucket");
    std::sort(a.begin() + 1, a.end());
    std::sort(b.begin() + 1, b.end());
    REQUIRE(a == b);
}

TEST_CASE("Failing records are reported unless raising", "[backend]") {
    auto path = write_file("oryx_backend_bad.csv", "n\n1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n11\n12\nx\n14\n");
    auto df = DataFrame::from_csv(path, TableOptions{.batch_size = 3});
    df.set_type("int", "n");

    auto out = tmp("oryx_backend_bad_out.csv");
    auto report = df.compute(ComputeOptions{.num_workers = 2, .output_path = out});
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.failures.size() == 1);
    REQUIRE(report.failures[0].row_id == 12);
    REQUIRE(report.failures[0].source == path.string());
    REQUIRE(report.rows_written == 13);
    REQUIRE(read_lines(out).back() == "14");

    REQUIRE_THROWS_AS(
        df.compute(ComputeOptions{.output_path = out, .raise_on_error = true}), OperationError);
}

TEST_CASE("Compute runs on a supplied backend", "[backend]") {
    auto df = DataFrame::from_csv(numbers(4));
    RecordingBackend backend;
    auto report = df.compute(
        ComputeOptions{.num_workers = 2, .output_path = tmp("oryx_backend_custom.csv"),
                       .select = std::vector<std::string>{"bucket"}},
        &backend);
    REQUIRE(report.rows_written == 4);
    REQUIRE(backend.calls == 1);
    REQUIRE(backend.workers == 2);
    REQUIRE(backend.header == std::vector<std::string>{"bucket"});
}

TEST_CASE("Backends reject out-of-range worker counts", "[backend]") {
    auto df = DataFrame::from_csv(numbers(4));
    runtime::LocalBackend backend;
    auto result = backend.execute(
        df.plan(), runtime::ExecutionOptions{.num_workers = 9,
                                             .output_path = tmp("oryx_backend_nine.csv")});
    REQUIRE_FALSE(result.has_value());
}

// ─── Aggregate ──────────────────────────────────────────────────────────────

TEST_CASE("Grouped aggregates spill and reduce every group", "[backend][aggregate]") {
    auto df = DataFrame::from_csv(numbers(30), TableOptions{.batch_size = 4});
    df.set_type("int", "n")
        .group_by({"bucket"})
        .aggregate(agg::sum(), {"n"}, {"total"})
        .aggregate(agg::count(), {"n"}, {"rows"})
        .aggregate(agg::first(), {"n"}, {"first"});

    auto work = tmp("oryx_backend_work");
    std::filesystem::remove_all(work);
    auto out = tmp("oryx_backend_groups.csv");
    auto report = df.compute(ComputeOptions{.num_workers = 4, .output_path = out,
                                            .work_dir = work});
    REQUIRE(report.ok());
    REQUIRE(report.rows_written == 3);
    REQUIRE(read_lines(out) == std::vector<std::string>{"bucket,total,rows,first",
                                                        "b0,135,10,0", "b1,145,10,1",
                                                        "b2,155,10,2"});
    // Partition files are removed once the run finishes.
    REQUIRE(std::filesystem::is_empty(work));
}

TEST_CASE("Aggregates over an empty table", "[backend][aggregate]") {
    auto path = write_file("oryx_backend_empty.csv", "n,bucket\n");
    auto out = tmp("oryx_backend_empty_out.csv");

    auto whole = DataFrame::from_csv(path);
    whole.set_type("int", "n").aggregate(agg::count(), {"n"}, {"rows"});
    whole.compute(ComputeOptions{.output_path = out});
    REQUIRE(read_lines(out) == std::vector<std::string>{"rows", "0"});

    auto grouped = DataFrame::from_csv(path);
    grouped.group_by({"bucket"}).aggregate(agg::count(), {"n"}, {"rows"});
    grouped.compute(ComputeOptions{.output_path = out});
    REQUIRE(read_lines(out) == std::vector<std::string>{"bucket,rows"});
}

TEST_CASE("A failing reduction is reported per group", "[backend][aggregate]") {
    auto df = DataFrame::from_csv(numbers(15));
    // Record 13 lies beyond the dry-run sample, so only the full run sees it.
    df.group_by({"bucket"}).aggregate(
        plan::Aggregator{.name = "picky",
                         .reduce = [](std::span<const Value> values) -> Value {
                             for (const auto& v : values) {
                                 if (std::get<std::string>(v) == "13") {
                                     throw std::runtime_error("unlucky");
                                 }
                             }
                             return static_cast<std::int64_t>(values.size());
                         }},
        {"n"});
    auto out = tmp("oryx_backend_picky.csv");

    SECTION("reported") {
        auto report = df.compute(ComputeOptions{.output_path = out});
        REQUIRE(report.failures.size() == 1);
        REQUIRE(report.failures[0].source == "group");
        REQUIRE(report.failures[0].row_id == 1);
        REQUIRE(report.failures[0].message == "aggregate 'picky(n)': unlucky");
        REQUIRE(read_lines(out) == std::vector<std::string>{"bucket,picky(n)", "b0,5", "b2,5"});
    }
    SECTION("raised") {
        REQUIRE_THROWS_AS(df.compute(ComputeOptions{.output_path = out, .raise_on_error = true}),
                          OperationError);
    }
}

TEST_CASE("Work directory comes from the environment", "[backend]") {
    auto dir = tmp("oryx_backend_env_dir");
    ::setenv("ORYX_WORK_DIR", dir.c_str(), 1);
    REQUIRE(runtime::default_work_dir() == dir);
    ::unsetenv("ORYX_WORK_DIR");
    REQUIRE(runtime::default_work_dir() == std::filesystem::temp_directory_path() / "oryx");
}

// ─── Join ───────────────────────────────────────────────────────────────────

namespace {

auto join_left() -> DataFrame {
    return DataFrame::from_csv(
        write_file("oryx_backend_join_l.csv", "id,v\n1,a\n2,b\n2,c\n3,d\n"));
}

auto join_right() -> DataFrame {
    return DataFrame::from_csv(
        write_file("oryx_backend_join_r.csv", "id,w\n2,x\n2,y\n4,z\n"));
}

}  // namespace

TEST_CASE("Equi-join row counts", "[backend][join]") {
    auto left = join_left();
    auto right = join_right();
    auto out = tmp("oryx_backend_join_out.csv");

    auto inner = inner_join(left, right, {"id"}, {"id"});
    REQUIRE(inner.compute(ComputeOptions{.output_path = out}).rows_written == 4);
    REQUIRE(read_lines(out)[0] == "1_id,1_v,2_id,2_w");

    auto outer = left_join(left, right, {"id"}, {"id"});
    REQUIRE(outer.compute(ComputeOptions{.output_path = out}).rows_written == 6);
    auto lines = read_lines(out);
    REQUIRE(lines[1] == "1,a,,");
    REQUIRE(lines.back() == "3,d,,");

    auto flipped = right_join(left, right, {"id"}, {"id"});
    REQUIRE(flipped.kind() == plan::JoinKind::Left);
    REQUIRE(flipped.col_names() == std::vector<std::string>{"2_id", "2_w", "1_id", "1_v"});
    REQUIRE(flipped.compute(ComputeOptions{.num_workers = 2, .output_path = out}).rows_written ==
            5);
    REQUIRE(read_lines(out).back() == "4,z,,");
}

TEST_CASE("Join output can be narrowed", "[backend][join]") {
    auto left = join_left();
    auto right = join_right();
    auto out = tmp("oryx_backend_join_select.csv");

    auto joined = inner_join(left, right, {"id"}, {"id"});
    joined.compute(ComputeOptions{.output_path = out,
                                  .select = std::vector<std::string>{"2_w", "1_v"}});
    auto lines = read_lines(out);
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0] == "2_w,1_v");
    std::sort(lines.begin() + 1, lines.end());
    REQUIRE(lines[1] == "x,b");
    REQUIRE(lines[4] == "y,c");

    REQUIRE_THROWS_AS(
        joined.compute(ComputeOptions{.output_path = out,
                                      .select = std::vector<std::string>{"v"}}),
        SchemaError);
}

TEST_CASE("Joins validate their inputs", "[backend][join]") {
    auto left = join_left();
    auto right = join_right();
    REQUIRE_THROWS_AS(inner_join(left, right, {"id"}, {"nope"}), SchemaError);
    REQUIRE_THROWS_AS(inner_join(left, right, {"id", "v"}, {"id"}), SchemaError);

    auto grouped = join_right();
    grouped.group_by({"id"}).aggregate(agg::count(), {"w"});
    REQUIRE_THROWS_AS(inner_join(left, grouped, {"id"}, {"id"}), SchemaError);
}

TEST_CASE("Rolling joins pick the nearest row in one direction", "[backend][join]") {
    auto trades = DataFrame::from_csv(
        write_file("oryx_backend_trades.csv", "t,sym\n5,a\n10,a\n1,b\n"));
    auto quotes = DataFrame::from_csv(
        write_file("oryx_backend_quotes.csv", "t,sym,px\n4,a,1\n9,a,2\n3,b,3\n"));
    trades.set_type("int", "t");
    quotes.set_type("int", "t");
    auto out = tmp("oryx_backend_rolling.csv");

    auto backward = rolling_join_backward(trades, quotes, {"sym"}, {"sym"}, "t", "t");
    backward.compute(ComputeOptions{.output_path = out});
    REQUIRE(read_lines(out) == std::vector<std::string>{"1_t,1_sym,2_t,2_sym,2_px",
                                                        "5,a,4,a,1", "10,a,9,a,2", "1,b,,,"});

    auto forward = rolling_join_forward(trades, quotes, {"sym"}, {"sym"}, "t", "t");
    forward.compute(ComputeOptions{.output_path = out});
    REQUIRE(read_lines(out) == std::vector<std::string>{"1_t,1_sym,2_t,2_sym,2_px",
                                                        "5,a,9,a,2", "10,a,,,", "1,b,3,b,3"});

    auto near = rolling_join_forward(trades, quotes, {"sym"}, {"sym"}, "t", "t",
                                     plan::JoinOptions{.limit = 2.0, .keep_unmatched = false});
    REQUIRE(near.compute(ComputeOptions{.output_path = out}).rows_written == 1);
    REQUIRE(read_lines(out).back() == "1,b,3,b,3");

    REQUIRE_THROWS_AS(rolling_join_forward(trades, quotes, {"sym"}, {"sym"}, "t", "time"),
                      SchemaError);
    REQUIRE_THROWS_AS(inner_join(trades, quotes, {"sym"}, {"sym"}, plan::JoinOptions{.limit = 1.0}),
                      SchemaError);
}
