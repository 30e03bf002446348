#pragma once

#include <oryx/plan/catalog.hpp>
#include <oryx/plan/row_info.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace oryx::plan {

/// Join type.
enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    /// Planned as a left join with the sides (and prefixes) swapped.
    Right,
    /// Nearest right row with roll key >= the left row's roll key.
    AsofForward,
    /// Nearest right row with roll key <= the left row's roll key.
    AsofBackward,
};

[[nodiscard]] auto join_kind_name(JoinKind kind) -> const char*;

struct JoinOptions {
    /// Output names are `<prefix>_<column>`; first entry for the left side.
    std::array<std::string, 2> prefix{"1", "2"};
    /// Maximum allowed roll-key distance for as-of joins.
    std::optional<double> limit;
    /// As-of joins null-pad left rows without a match (left semantics);
    /// false drops them (inner semantics).
    bool keep_unmatched = true;
};

/// One side of a join, resolved to physical slots.
struct JoinSide {
    std::string prefix;
    /// Physical slots emitted into the output, in dense column order.
    std::vector<std::size_t> carried;
    std::vector<std::size_t> keys;
    std::vector<KeyFn> collations;
    std::optional<std::size_t> roll;
    /// Formatters of carried columns, keyed by carried position.
    std::map<std::size_t, Formatter> formatters;
};

/// Index algebra of a join evaluation. Output rows are assembled as
/// `left.carried ++ right.carried` and then permuted by `write_index`.
struct JoinLayout {
    JoinKind kind = JoinKind::Inner;
    JoinSide left;
    JoinSide right;
    std::optional<double> limit;
    bool keep_unmatched = true;
    /// Materialize the left side for matching and stream the right side.
    /// Only ever set for inner joins; never changes which rows are emitted
    /// or their column order.
    bool build_left = false;
    std::vector<std::size_t> write_index;
    std::vector<std::string> header;
};

/// Validates a join between two catalogs and derives its layout.
///
/// The planner only holds read-only references; both catalogs must outlive
/// it. Right joins are normalized into left joins with the sides swapped, so
/// left()/right() report the post-normalization sides.
class JoinPlanner {
   public:
    JoinPlanner(const ColumnCatalog& left, const ColumnCatalog& right, JoinKind kind,
                std::vector<KeySpec> left_keys, std::vector<KeySpec> right_keys,
                JoinOptions options = {}, std::optional<std::string> left_roll = std::nullopt,
                std::optional<std::string> right_roll = std::nullopt);

    [[nodiscard]] auto kind() const noexcept -> JoinKind { return kind_; }
    [[nodiscard]] auto swapped() const noexcept -> bool { return swapped_; }

    /// Combined output schema: prefixed left names, then prefixed right names.
    [[nodiscard]] auto output_names() const -> std::vector<std::string>;

    /// Resolve `select` (nullopt = all columns). Source sizes drive the
    /// build-side choice for inner joins.
    [[nodiscard]] auto layout(const std::optional<std::vector<std::string>>& select,
                              std::uintmax_t left_bytes = 0, std::uintmax_t right_bytes = 0) const
        -> JoinLayout;

   private:
    const ColumnCatalog* left_;
    const ColumnCatalog* right_;
    JoinKind kind_;
    bool swapped_ = false;
    std::vector<KeySpec> left_keys_;
    std::vector<KeySpec> right_keys_;
    JoinOptions options_;
    std::optional<std::size_t> left_roll_;
    std::optional<std::size_t> right_roll_;
};

}  // namespace oryx::plan
