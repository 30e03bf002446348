#pragma once

#include <oryx/core/types.hpp>
#include <oryx/core/value.hpp>
#include <oryx/plan/catalog.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace oryx::plan {

/// One key of a multi-key sort over source records.
struct SortKey {
    /// File column read from each record.
    std::size_t column = 0;
    bool descending = false;
    /// Declared parser of the column; compares raw text when unset.
    Parser parser;
    std::string name;
};

/// Parse an order specification such as `{"+", "Salary", "-", "Name"}`:
/// direction markers alternating with column names, direction first.
///
/// Throws SchemaError when the list is empty, does not alternate, names an
/// unknown column, or names a computed column (sorting reads source records).
[[nodiscard]] auto parse_sort_spec(const std::vector<std::string>& spec,
                                   const ColumnCatalog& catalog) -> std::vector<SortKey>;

/// Total order over source records for a list of sort keys.
///
/// Records are compared on typed key tuples produced by extract(), so the
/// parse cost is paid once per record rather than once per comparison.
class RowComparator {
   public:
    explicit RowComparator(std::vector<SortKey> keys);

    /// Typed key tuple of a record. Throws if a key cell does not parse.
    [[nodiscard]] auto extract(const std::vector<std::string>& fields) const
        -> std::vector<Value>;

    /// Three-way comparison of two key tuples honouring each key's direction.
    [[nodiscard]] auto compare(std::span<const Value> lhs, std::span<const Value> rhs) const
        -> int;

    auto operator()(std::span<const Value> lhs, std::span<const Value> rhs) const -> bool {
        return compare(lhs, rhs) < 0;
    }

    [[nodiscard]] auto keys() const noexcept -> const std::vector<SortKey>& { return keys_; }

   private:
    std::vector<SortKey> keys_;
};

}  // namespace oryx::plan
