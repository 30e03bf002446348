#include <oryx/runtime/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace oryx;
using namespace oryx::runtime;

namespace {

auto slurp(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}  // namespace

TEST_CASE("Record text joins lines inside quotes", "[csv]") {
    std::istringstream input("a,\"line one\nline two\",c\r\n\n\nd,e,f\n");
    std::string record;

    REQUIRE(read_record_text(input, record));
    REQUIRE(record == "a,\"line one\nline two\",c");

    REQUIRE(read_record_text(input, record));
    REQUIRE(record == "d,e,f");

    REQUIRE_FALSE(read_record_text(input, record));
}

TEST_CASE("Record text handles a missing final newline", "[csv]") {
    std::istringstream input("x,y");
    std::string record;
    REQUIRE(read_record_text(input, record));
    REQUIRE(record == "x,y");
    REQUIRE_FALSE(read_record_text(input, record));
}

TEST_CASE("Records tokenize with quoting", "[csv]") {
    auto records = parse_csv_records("A,\"B, C\",D\n1,,3\n", ',');
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 2);
    REQUIRE((*records)[0] == std::vector<std::string>{"A", "B, C", "D"});
    REQUIRE((*records)[1] == std::vector<std::string>{"1", "", "3"});
}

TEST_CASE("Records tokenize with a custom separator", "[csv]") {
    auto records = parse_csv_records("a;b,c;d\n", ';');
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 1);
    REQUIRE((*records)[0] == std::vector<std::string>{"a", "b,c", "d"});
}

TEST_CASE("Empty text has no records", "[csv]") {
    auto records = parse_csv_records("", ',');
    REQUIRE(records.has_value());
    REQUIRE(records->empty());
}

TEST_CASE("Rows quote only when needed", "[csv]") {
    REQUIRE(format_csv_row({"plain", "1.5", ""}, ',') == "plain,1.5,");
    REQUIRE(format_csv_row({"a,b", "say \"hi\"", "two\nlines"}, ',') ==
            "\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\"");
    REQUIRE(format_csv_row({"a,b", "c;d"}, ';') == "a,b;\"c;d\"");
}

TEST_CASE("Writer creates parent directories and renders values", "[csv]") {
    auto dir = std::filesystem::temp_directory_path() / "oryx_csv_writer" / "nested";
    std::filesystem::remove_all(dir.parent_path());
    auto path = dir / "out.csv";

    auto writer = CsvWriter::open(path);
    REQUIRE(writer.has_value());
    writer->write(std::vector<std::string>{"k", "v", "w"});
    writer->write(Row{Value{std::string("x, y")}, Value{std::int64_t{7}}, Value{}});
    writer->write(Row{Value{std::string("z")}, Value{2.5}, Value{Date{0}}});
    REQUIRE(writer->close().has_value());

    REQUIRE(slurp(path) == "k,v,w\n\"x, y\",7,\nz,2.5,1970-01-01\n");
}

TEST_CASE("Writer reports an unopenable path", "[csv]") {
    auto blocker = std::filesystem::temp_directory_path() / "oryx_csv_blocker";
    {
        std::ofstream f(blocker);
        f << "file";
    }
    auto writer = CsvWriter::open(blocker / "out.csv");
    REQUIRE_FALSE(writer.has_value());
}
