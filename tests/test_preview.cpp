#include <oryx/core/error.hpp>
#include <oryx/frame/dataframe.hpp>
#include <oryx/frame/joined.hpp>
#include <oryx/plan/aggregators.hpp>
#include <oryx/runtime/preview.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <variant>
#include <vector>

using namespace oryx;

namespace {

auto write_file(const char* name, const std::string& text) -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

auto numbered(int rows) -> std::filesystem::path {
    std::string text = "n,parity\n";
    for (int i = 0; i < rows; ++i) {
        text += std::to_string(i) + (i % 2 == 0 ? ",even\n" : ",odd\n");
    }
    return write_file("oryx_preview_numbered.csv", text);
}

}  // namespace

TEST_CASE("Preview reads only the sampled records", "[preview]") {
    auto df = DataFrame::from_csv(numbered(50));
    df.set_type("int", "n");

    auto result = df.preview(5, 10);
    REQUIRE(result.header == std::vector<std::string>{"n", "parity"});
    REQUIRE(result.rows.size() == 5);
    REQUIRE(result.rows.back() == std::vector<std::string>{"4", "even"});

    auto capped = df.preview(20, 3);
    REQUIRE(capped.rows.size() == 3);
}

TEST_CASE("Preview of a filtered frame keeps passing rows only", "[preview]") {
    auto df = DataFrame::from_csv(numbered(50));
    df.set_type("int", "n").filter({"n"}, [](std::span<const Value> v) {
        return std::get<std::int64_t>(v[0]) % 3 == 0;
    });

    auto result = df.preview(10, 10);
    REQUIRE(result.rows.size() == 4);
    REQUIRE(result.rows[1][0] == "3");
}

TEST_CASE("Preview aggregates over the sample", "[preview]") {
    auto df = DataFrame::from_csv(numbered(50));
    df.set_type("int", "n").group_by({"parity"}).aggregate(agg::sum(), {"n"}, {"total"});

    auto result = df.preview(6, 10);
    REQUIRE(result.header == std::vector<std::string>{"parity", "total"});
    REQUIRE(result.rows.size() == 2);
    REQUIRE(result.rows[0] == std::vector<std::string>{"even", "6"});
    REQUIRE(result.rows[1] == std::vector<std::string>{"odd", "9"});
}

TEST_CASE("Unformatted preview shows typed key values", "[preview]") {
    auto path = write_file("oryx_preview_dates.csv", "day,v\n2024/01/02,1\n2024/01/02,2\n");
    auto df = DataFrame::from_csv(path);
    df.set_type("date:%Y/%m/%d", "day").set_type("int", "v");
    df.group_by({"day"}).aggregate(agg::count(), {"v"});

    REQUIRE(df.preview().rows[0] == std::vector<std::string>{"2024/01/02", "2"});
    REQUIRE(df.preview(10, 10, false).rows[0] == std::vector<std::string>{"2024-01-02", "2"});
}

TEST_CASE("Preview of a join matches within the samples", "[preview]") {
    auto left = DataFrame::from_csv(
        write_file("oryx_preview_left.csv", "id,name\n1,a\n2,b\n3,c\n"));
    auto right = DataFrame::from_csv(
        write_file("oryx_preview_right.csv", "id,score\n3,30\n1,10\n"));

    auto joined = inner_join(left, right, {"id"}, {"id"});
    auto result = joined.preview();
    REQUIRE(result.header == std::vector<std::string>{"1_id", "1_name", "2_id", "2_score"});
    REQUIRE(result.rows.size() == 2);
    REQUIRE(result.rows[0] == std::vector<std::string>{"1", "a", "1", "10"});
    REQUIRE(result.rows[1] == std::vector<std::string>{"3", "c", "3", "30"});
}

TEST_CASE("Preview failures carry the failing record", "[preview]") {
    auto path = write_file("oryx_preview_bad.csv", "n\n1\n2\nx\n");
    auto df = DataFrame::from_csv(path);

    std::string message;
    try {
        df.set_type("int", "n");
    } catch (const OperationError& e) {
        message = e.what();
    }
    REQUIRE(message.find("set_type(int, n)") != std::string::npos);
    REQUIRE(message.find("record 2") != std::string::npos);
    REQUIRE(message.find("'x'") != std::string::npos);
    REQUIRE(df.col_types()[0].second == ColumnType::Raw);

    // A sample that stops before the bad record passes.
    auto plan = df.plan();
    REQUIRE(runtime::preview(plan, 2, 10).has_value());
}

TEST_CASE("Rendered previews align columns", "[preview]") {
    runtime::PreviewResult result{.header = {"name", "v"},
                                  .rows = {{"alpha", "1"}, {"b", "22"}}};
    REQUIRE(runtime::render_preview(result) == "name   v\nalpha  1\nb      22\n");
}
