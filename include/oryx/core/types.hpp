#pragma once

#include <oryx/core/value.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace oryx {

/// Declared type of a catalog column.
enum class ColumnType : std::uint8_t {
    Int,
    Double,
    String,
    Date,
    /// No registered parser (cells stay text, or a user parser is attached).
    Raw,
};

/// Converts a cell to its typed value. Throws on malformed input.
using Parser = std::function<Value(const Value&)>;

/// Converts a typed value back to its display representation.
using Formatter = std::function<Value(const Value&)>;

/// Resolved entry of the type registry.
struct TypeSpec {
    ColumnType type = ColumnType::Raw;
    /// Date pattern for `date:<pattern>` tags; empty for other types.
    std::string pattern;
    Parser parser;
    Formatter formatter;
};

[[nodiscard]] auto type_name(ColumnType type) -> std::string_view;

/// Look up a type tag such as `int`, `double`, `string`, `date` or
/// `date:%d/%m/%Y`. Returns nullopt for an unknown tag.
[[nodiscard]] auto resolve_type(std::string_view tag) -> std::optional<TypeSpec>;

[[nodiscard]] auto make_parser(ColumnType type, std::string_view pattern = {}) -> Parser;
[[nodiscard]] auto make_formatter(ColumnType type, std::string_view pattern = {}) -> Formatter;

}  // namespace oryx
