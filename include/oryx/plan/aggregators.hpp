#pragma once

#include <oryx/plan/row_info.hpp>

namespace oryx::agg {

// Built-in reductions. Nulls are skipped by every function except count,
// first and last, which see the group's values as they arrived.

/// Integer sum when every value is an int, double sum otherwise.
[[nodiscard]] auto sum() -> plan::Aggregator;
/// Arithmetic mean as a double; null for an empty group.
[[nodiscard]] auto mean() -> plan::Aggregator;
[[nodiscard]] auto min() -> plan::Aggregator;
[[nodiscard]] auto max() -> plan::Aggregator;
/// Number of rows in the group.
[[nodiscard]] auto count() -> plan::Aggregator;
[[nodiscard]] auto first() -> plan::Aggregator;
[[nodiscard]] auto last() -> plan::Aggregator;

}  // namespace oryx::agg
