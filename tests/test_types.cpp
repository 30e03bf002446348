#include <oryx/core/time.hpp>
#include <oryx/core/types.hpp>
#include <oryx/core/value.hpp>
#include <oryx/plan/aggregators.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace oryx;

TEST_CASE("Type registry resolves built-in tags", "[types]") {
    auto int_spec = resolve_type("int");
    REQUIRE(int_spec.has_value());
    REQUIRE(int_spec->type == ColumnType::Int);
    REQUIRE(std::get<std::int64_t>(int_spec->parser(Value{std::string("42")})) == 42);
    REQUIRE(std::get<std::int64_t>(int_spec->parser(Value{std::string(" -7 ")})) == -7);

    auto dbl = resolve_type("double");
    REQUIRE(dbl.has_value());
    REQUIRE(std::get<double>(dbl->parser(Value{std::string("2.5")})) == Catch::Approx(2.5));

    auto str = resolve_type("string");
    REQUIRE(str.has_value());
    REQUIRE(std::get<std::string>(str->parser(Value{std::int64_t{3}})) == "3");
}

TEST_CASE("Type registry rejects unknown tags", "[types]") {
    REQUIRE_FALSE(resolve_type("decimal").has_value());
    REQUIRE_FALSE(resolve_type("int:%Y").has_value());
    REQUIRE_FALSE(resolve_type("").has_value());
}

TEST_CASE("Empty cells parse to null", "[types]") {
    for (const char* tag : {"int", "double", "date"}) {
        auto spec = resolve_type(tag);
        REQUIRE(spec.has_value());
        REQUIRE(is_null(spec->parser(Value{std::string("")})));
    }
}

TEST_CASE("Malformed cells throw", "[types]") {
    auto spec = resolve_type("int");
    REQUIRE(spec.has_value());
    REQUIRE_THROWS_AS(spec->parser(Value{std::string("12abc")}), std::invalid_argument);
    auto date = resolve_type("date");
    REQUIRE(date.has_value());
    REQUIRE_THROWS_AS(date->parser(Value{std::string("2024-02-30")}), std::invalid_argument);
}

TEST_CASE("Int parser truncates doubles and rejects those out of range", "[types]") {
    auto spec = resolve_type("int");
    REQUIRE(spec.has_value());
    REQUIRE(std::get<std::int64_t>(spec->parser(Value{42.9})) == 42);
    REQUIRE(std::get<std::int64_t>(spec->parser(Value{-3.5})) == -3);
    REQUIRE_THROWS_AS(spec->parser(Value{std::numeric_limits<double>::quiet_NaN()}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(spec->parser(Value{std::numeric_limits<double>::infinity()}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(spec->parser(Value{1e300}), std::invalid_argument);
    REQUIRE_THROWS_AS(spec->parser(Value{9223372036854775808.0}), std::invalid_argument);
}

TEST_CASE("Date patterns parse and format symmetrically", "[types][date]") {
    auto spec = resolve_type("date:%d/%m/%Y");
    REQUIRE(spec.has_value());
    REQUIRE(spec->type == ColumnType::Date);
    REQUIRE(spec->pattern == "%d/%m/%Y");

    auto parsed = spec->parser(Value{std::string("05/03/2024")});
    REQUIRE(std::holds_alternative<Date>(parsed));
    REQUIRE(std::get<Date>(parsed) == *parse_date("2024-03-05"));
    REQUIRE(std::get<std::string>(spec->formatter(parsed)) == "05/03/2024");
}

TEST_CASE("Epoch dates", "[date]") {
    REQUIRE(parse_date("1970-01-01")->days == 0);
    REQUIRE(parse_date("1970-01-02")->days == 1);
    REQUIRE(parse_date("1969-12-31")->days == -1);
    REQUIRE(format_date(Date{0}) == "1970-01-01");
    REQUIRE_FALSE(parse_date("1970-1-1x").has_value());
}

TEST_CASE("Value comparison", "[value]") {
    REQUIRE(compare_values(Value{std::int64_t{2}}, Value{2.0}) == 0);
    REQUIRE(compare_values(Value{std::int64_t{1}}, Value{1.5}) < 0);
    REQUIRE(compare_values(Value{}, Value{std::int64_t{-100}}) < 0);
    REQUIRE(compare_values(Value{std::string("b")}, Value{std::string("a")}) > 0);
    REQUIRE(compare_values(Value{Date{3}}, Value{Date{2}}) > 0);

    std::vector<Value> a{Value{std::string("x")}, Value{std::int64_t{1}}};
    std::vector<Value> b{Value{std::string("x")}, Value{std::int64_t{2}}};
    REQUIRE(compare_tuples(a, b) < 0);
    REQUIRE(compare_tuples(b, b) == 0);
}

TEST_CASE("Equal numeric keys hash alike", "[value]") {
    std::vector<Value> as_int{Value{std::int64_t{2}}};
    std::vector<Value> as_double{Value{2.0}};
    REQUIRE(TupleEq{}(as_int, as_double));
    REQUIRE(TupleHash{}(as_int) == TupleHash{}(as_double));
}

TEST_CASE("Spill encoding keeps value kinds", "[value]") {
    std::vector<Value> values{Value{}, Value{std::int64_t{-12}}, Value{0.1},
                              Value{std::string("a,\"b\"")}, Value{Date{19000}}};
    for (const auto& value : values) {
        auto decoded = decode_value(encode_value(value));
        REQUIRE(decoded.has_value());
        REQUIRE(kind_of(*decoded) == kind_of(value));
        REQUIRE(compare_values(*decoded, value) == 0);
    }
    REQUIRE_FALSE(decode_value("").has_value());
    REQUIRE_FALSE(decode_value("ix").has_value());
}

TEST_CASE("Display text", "[value]") {
    REQUIRE(to_text(Value{}) == "");
    REQUIRE(to_text(Value{std::int64_t{5}}) == "5");
    REQUIRE(to_text(Value{2.5}) == "2.5");
    REQUIRE(to_text(Value{Date{0}}) == "1970-01-01");
}

TEST_CASE("Built-in aggregators", "[aggregate]") {
    std::vector<Value> ints{Value{std::int64_t{1}}, Value{}, Value{std::int64_t{5}}};
    std::vector<Value> mixed{Value{std::int64_t{1}}, Value{0.5}};
    std::vector<Value> empty;

    REQUIRE(std::get<std::int64_t>(agg::sum().reduce(ints)) == 6);
    REQUIRE(std::get<double>(agg::sum().reduce(mixed)) == Catch::Approx(1.5));
    REQUIRE(std::get<double>(agg::mean().reduce(ints)) == Catch::Approx(3.0));
    REQUIRE(is_null(agg::mean().reduce(empty)));
    REQUIRE(std::get<std::int64_t>(agg::min().reduce(ints)) == 1);
    REQUIRE(std::get<std::int64_t>(agg::max().reduce(ints)) == 5);
    REQUIRE(std::get<std::int64_t>(agg::count().reduce(ints)) == 3);
    REQUIRE(std::get<std::int64_t>(agg::first().reduce(ints)) == 1);
    REQUIRE(std::get<std::int64_t>(agg::last().reduce(ints)) == 5);

    std::vector<Value> text{Value{std::string("x")}};
    REQUIRE_THROWS_AS(agg::sum().reduce(text), std::invalid_argument);
}

TEST_CASE("Integer sum falls back to double on overflow", "[aggregate]") {
    constexpr auto top = std::numeric_limits<std::int64_t>::max();
    std::vector<Value> big{Value{top}, Value{std::int64_t{1}}};
    auto total = agg::sum().reduce(big);
    REQUIRE(std::holds_alternative<double>(total));
    REQUIRE(std::get<double>(total) == Catch::Approx(9.223372036854775808e18));

    std::vector<Value> low{Value{std::numeric_limits<std::int64_t>::min()},
                           Value{std::int64_t{-1}}};
    REQUIRE(std::holds_alternative<double>(agg::sum().reduce(low)));

    std::vector<Value> fits{Value{top}, Value{std::int64_t{-1}}};
    REQUIRE(std::get<std::int64_t>(agg::sum().reduce(fits)) == top - 1);
}
