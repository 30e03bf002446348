#pragma once

#include <oryx/core/time.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oryx {

/// A single cell flowing through a pipeline.
///
/// Cells read from a file start out as strings; parsers registered in the
/// column catalog turn them into typed values. `std::monostate` is null and is
/// what an outer join pads unmatched sides with.
using Value = std::variant<std::monostate, std::int64_t, double, std::string, Date>;

/// One evaluated row, indexed by physical column slot.
using Row = std::vector<Value>;

enum class ValueKind : std::uint8_t {
    Null,
    Int,
    Double,
    String,
    Date,
};

[[nodiscard]] inline auto kind_of(const Value& value) noexcept -> ValueKind {
    return static_cast<ValueKind>(value.index());
}

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] auto kind_name(ValueKind kind) -> std::string_view;

/// Numeric view of int/double/date values; nullopt for strings and null.
[[nodiscard]] auto as_double(const Value& value) -> std::optional<double>;

/// Three-way comparison used by sorting, grouping and as-of matching.
/// Null orders first, int and double compare numerically, other mixed kinds
/// order by kind.
[[nodiscard]] auto compare_values(const Value& lhs, const Value& rhs) -> int;

/// Lexicographic comparison of two equally long value tuples.
[[nodiscard]] auto compare_tuples(std::span<const Value> lhs, std::span<const Value> rhs) -> int;

/// Display text of a value: integers and dates as usual, doubles with `{:g}`,
/// null as the empty string.
[[nodiscard]] auto to_text(const Value& value) -> std::string;

/// Kind-preserving text encoding used for spill files.
[[nodiscard]] auto encode_value(const Value& value) -> std::string;
[[nodiscard]] auto decode_value(std::string_view text) -> std::optional<Value>;

/// Hash of a key tuple, consistent with compare_tuples() == 0 for same-kind values.
struct TupleHash {
    auto operator()(const std::vector<Value>& key) const noexcept -> std::size_t;
};

struct TupleEq {
    auto operator()(const std::vector<Value>& lhs, const std::vector<Value>& rhs) const -> bool {
        return lhs.size() == rhs.size() && compare_tuples(lhs, rhs) == 0;
    }
};

}  // namespace oryx
