#pragma once

#include <oryx/plan/catalog.hpp>
#include <oryx/plan/row_info.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace oryx::plan {

/// Group key expressed against the carried column layout.
struct KeyRef {
    KeyFn collation;
    std::size_t position = 0;
};

/// Aggregate expressed against the carried column layout.
struct AggregateRef {
    Aggregator func;
    std::size_t position = 0;
    std::string name;
    /// Declared type and formatter of the source column. The formatter only
    /// applies to results of that type, so `count` over a date stays a number.
    ColumnType source_type = ColumnType::Raw;
    Formatter formatter;
};

/// Index algebra of a group/aggregate evaluation.
///
/// The group stage carries only `carried` (ascending physical slots). Keys and
/// aggregates reference positions within that projection. The reduce stage
/// produces one row of `keys ++ aggregates` per group; `write_index` picks the
/// output columns from it in the order the caller selected.
struct AggregateLayout {
    bool grouped = false;
    std::vector<std::size_t> carried;
    std::vector<KeyRef> keys;
    std::vector<AggregateRef> aggregates;
    std::vector<std::size_t> write_index;
    /// Formatters of key columns, keyed by carried position.
    std::map<std::size_t, Formatter> formatters;
    std::vector<std::string> header;
};

/// Derives the post-aggregate schema and index remapping of one table.
class GroupAggregateIndexer {
   public:
    GroupAggregateIndexer(const ColumnCatalog& catalog, const RowPipelineDescriptor& rows);

    /// Virtual output schema: group-by key names, then aggregate names.
    [[nodiscard]] auto output_names() const -> std::vector<std::string>;

    /// Resolve `select` (nullopt = every output column) against the virtual
    /// schema. Throws SchemaError for unknown names or deleted key columns.
    [[nodiscard]] auto layout(const std::optional<std::vector<std::string>>& select) const
        -> AggregateLayout;

   private:
    const ColumnCatalog* catalog_;
    const RowPipelineDescriptor* rows_;
};

}  // namespace oryx::plan
