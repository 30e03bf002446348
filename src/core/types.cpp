#include <oryx/core/types.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace oryx {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto parse_int(const Value& cell) -> Value {
    if (std::holds_alternative<std::int64_t>(cell) || is_null(cell)) {
        return cell;
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        // 2^63 is exactly representable; anything at or beyond it has no int64 value.
        constexpr double bound = 9223372036854775808.0;
        if (!std::isfinite(*d) || *d < -bound || *d >= bound) {
            throw std::invalid_argument(fmt::format("{} is out of range for int", *d));
        }
        return static_cast<std::int64_t>(*d);
    }
    const auto* text = std::get_if<std::string>(&cell);
    if (text == nullptr) {
        throw std::invalid_argument(
            fmt::format("cannot convert {} to int", kind_name(kind_of(cell))));
    }
    auto body = trim(*text);
    if (body.empty()) {
        return Value{};
    }
    std::int64_t out = 0;
    auto result = std::from_chars(body.data(), body.data() + body.size(), out);
    if (result.ec != std::errc() || result.ptr != body.data() + body.size()) {
        throw std::invalid_argument(fmt::format("cannot parse '{}' as int", *text));
    }
    return out;
}

auto parse_double(const Value& cell) -> Value {
    if (std::holds_alternative<double>(cell) || is_null(cell)) {
        return cell;
    }
    if (const auto* i = std::get_if<std::int64_t>(&cell)) {
        return static_cast<double>(*i);
    }
    const auto* text = std::get_if<std::string>(&cell);
    if (text == nullptr) {
        throw std::invalid_argument(
            fmt::format("cannot convert {} to double", kind_name(kind_of(cell))));
    }
    std::string body(trim(*text));
    if (body.empty()) {
        return Value{};
    }
    char* end = nullptr;
    double out = std::strtod(body.c_str(), &end);
    if (end == body.c_str() || *end != '\0') {
        throw std::invalid_argument(fmt::format("cannot parse '{}' as double", *text));
    }
    return out;
}

auto parse_string(const Value& cell) -> Value {
    if (std::holds_alternative<std::string>(cell) || is_null(cell)) {
        return cell;
    }
    return to_text(cell);
}

}  // namespace

auto type_name(ColumnType type) -> std::string_view {
    switch (type) {
        case ColumnType::Int:
            return "int";
        case ColumnType::Double:
            return "double";
        case ColumnType::String:
            return "string";
        case ColumnType::Date:
            return "date";
        case ColumnType::Raw:
            return "raw";
    }
    return "raw";
}

auto make_parser(ColumnType type, std::string_view pattern) -> Parser {
    switch (type) {
        case ColumnType::Int:
            return parse_int;
        case ColumnType::Double:
            return parse_double;
        case ColumnType::String:
            return parse_string;
        case ColumnType::Date: {
            std::string fmt_pattern(pattern.empty() ? kDefaultDatePattern : pattern);
            return [fmt_pattern](const Value& cell) -> Value {
                if (std::holds_alternative<Date>(cell) || is_null(cell)) {
                    return cell;
                }
                const auto* text = std::get_if<std::string>(&cell);
                if (text == nullptr) {
                    throw std::invalid_argument(
                        fmt::format("cannot convert {} to date", kind_name(kind_of(cell))));
                }
                auto body = trim(*text);
                if (body.empty()) {
                    return Value{};
                }
                auto date = parse_date(body, fmt_pattern);
                if (!date) {
                    throw std::invalid_argument(
                        fmt::format("cannot parse '{}' as date ({})", *text, fmt_pattern));
                }
                return *date;
            };
        }
        case ColumnType::Raw:
            return {};
    }
    return {};
}

auto make_formatter(ColumnType type, std::string_view pattern) -> Formatter {
    if (type == ColumnType::Date) {
        std::string fmt_pattern(pattern.empty() ? kDefaultDatePattern : pattern);
        return [fmt_pattern](const Value& value) -> Value {
            if (const auto* date = std::get_if<Date>(&value)) {
                return format_date(*date, fmt_pattern);
            }
            return value;
        };
    }
    if (type == ColumnType::Raw) {
        return {};
    }
    return [](const Value& value) -> Value {
        if (is_null(value)) {
            return value;
        }
        return to_text(value);
    };
}

auto resolve_type(std::string_view tag) -> std::optional<TypeSpec> {
    std::string_view name = tag;
    std::string_view pattern;
    if (auto colon = tag.find(':'); colon != std::string_view::npos) {
        name = tag.substr(0, colon);
        pattern = tag.substr(colon + 1);
    }

    ColumnType type = ColumnType::Raw;
    if (name == "int") {
        type = ColumnType::Int;
    } else if (name == "double") {
        type = ColumnType::Double;
    } else if (name == "string") {
        type = ColumnType::String;
    } else if (name == "date") {
        type = ColumnType::Date;
    } else {
        return std::nullopt;
    }
    if (!pattern.empty() && type != ColumnType::Date) {
        return std::nullopt;
    }

    return TypeSpec{.type = type,
                    .pattern = std::string(pattern),
                    .parser = make_parser(type, pattern),
                    .formatter = make_formatter(type, pattern)};
}

}  // namespace oryx
