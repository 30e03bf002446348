#include <oryx/runtime/row_source.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace oryx;
using namespace oryx::runtime;

namespace {

auto write_file(const char* name, const std::string& text) -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

auto numbered(int rows) -> std::string {
    std::string text = "id,label\n";
    for (int i = 0; i < rows; ++i) {
        text += std::to_string(i) + ",r" + std::to_string(i) + "\n";
    }
    return text;
}

auto drain(RowSource& source) -> std::vector<SourceRow> {
    std::vector<SourceRow> rows;
    while (true) {
        auto row = source.next();
        REQUIRE(row.has_value());
        if (!*row) {
            break;
        }
        rows.push_back(std::move(**row));
    }
    return rows;
}

}  // namespace

TEST_CASE("Rows come out in file order with sequential ids", "[source]") {
    auto path = write_file("oryx_source_order.csv", numbered(7));
    auto source = CsvRowSource::open(path, TableOptions{.batch_size = 3});
    REQUIRE(source.has_value());

    auto rows = drain(**source);
    REQUIRE(rows.size() == 7);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(rows[i].id == i);
        REQUIRE(rows[i].fields == std::vector<std::string>{std::to_string(i), "r" + std::to_string(i)});
    }
    REQUIRE((*source)->completed());
}

TEST_CASE("Checkpoint is empty before the first row", "[source]") {
    auto path = write_file("oryx_source_checkpoint.csv", numbered(3));
    auto source = CsvRowSource::open(path, TableOptions{});
    REQUIRE(source.has_value());
    REQUIRE_FALSE((*source)->checkpoint().has_value());
    REQUIRE_FALSE((*source)->completed());

    auto row = (*source)->next();
    REQUIRE(row.has_value());
    REQUIRE((*source)->checkpoint() == std::optional<std::uint64_t>{1});
}

TEST_CASE("Recovering from a checkpoint replays the remaining rows", "[source]") {
    auto path = write_file("oryx_source_recover.csv", numbered(25));

    for (std::uint64_t stop : {1u, 4u, 5u, 13u, 25u}) {
        auto source = CsvRowSource::open(path, TableOptions{.batch_size = 4});
        REQUIRE(source.has_value());
        for (std::uint64_t i = 0; i < stop; ++i) {
            auto row = (*source)->next();
            REQUIRE(row.has_value());
            REQUIRE(row->has_value());
        }
        auto checkpoint = (*source)->checkpoint();
        REQUIRE(checkpoint == std::optional<std::uint64_t>{stop});
        auto rest = drain(**source);

        auto resumed = resume(path, TableOptions{.batch_size = 7}, *checkpoint);
        REQUIRE(resumed.has_value());
        auto replay = drain(**resumed);

        REQUIRE(replay.size() == rest.size());
        for (std::size_t i = 0; i < rest.size(); ++i) {
            REQUIRE(replay[i].id == rest[i].id);
            REQUIRE(replay[i].fields == rest[i].fields);
        }
    }
}

TEST_CASE("Recovering past the end is an error", "[source]") {
    auto path = write_file("oryx_source_short.csv", numbered(2));
    auto source = CsvRowSource::open(path, TableOptions{});
    REQUIRE(source.has_value());
    REQUIRE_FALSE((*source)->recover(5).has_value());
}

TEST_CASE("Batches hold at most batch_size rows", "[source]") {
    auto path = write_file("oryx_source_batches.csv", numbered(10));
    auto source = CsvRowSource::open(path, TableOptions{.batch_size = 4});
    REQUIRE(source.has_value());

    std::vector<std::size_t> sizes;
    while (true) {
        auto batch = (*source)->next_batch();
        REQUIRE(batch.has_value());
        if (batch->empty()) {
            break;
        }
        sizes.push_back(batch->size());
    }
    REQUIRE(sizes == std::vector<std::size_t>{4, 4, 2});
}

TEST_CASE("Multiline quoted fields count as one record", "[source]") {
    auto path = write_file("oryx_source_multiline.csv", "a,b\n\"x\ny\",1\nz,2\n");
    auto source = CsvRowSource::open(path, TableOptions{});
    REQUIRE(source.has_value());
    auto rows = drain(**source);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].fields[0] == "x\ny");
    REQUIRE(rows[1].id == 1);
}

TEST_CASE("Headerless files read every line as data", "[source]") {
    auto path = write_file("oryx_source_noheader.csv", "1;2;3\n4;5;6\n");
    TableOptions options{.have_header = false, .separator = ';'};

    auto names = read_header(path, options);
    REQUIRE(names.has_value());
    REQUIRE(*names == std::vector<std::string>{"Col_1", "Col_2", "Col_3"});

    auto source = CsvRowSource::open(path, options);
    REQUIRE(source.has_value());
    auto rows = drain(**source);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].fields == std::vector<std::string>{"1", "2", "3"});
}

TEST_CASE("Header names come from the first record", "[source]") {
    auto path = write_file("oryx_source_header.csv", "Name,\"Dept, long\"\nA,X\n");
    auto names = read_header(path, TableOptions{});
    REQUIRE(names.has_value());
    REQUIRE(*names == std::vector<std::string>{"Name", "Dept, long"});
}

TEST_CASE("Missing and empty files are reported", "[source]") {
    auto empty = write_file("oryx_source_empty.csv", "");
    REQUIRE_FALSE(read_header(empty, TableOptions{}).has_value());

    auto missing = std::filesystem::temp_directory_path() / "oryx_source_missing.csv";
    std::filesystem::remove(missing);
    REQUIRE_FALSE(read_header(missing, TableOptions{}).has_value());
    REQUIRE_FALSE(CsvRowSource::open(missing, TableOptions{}).has_value());
}
