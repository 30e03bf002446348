#pragma once

#include <cstddef>

namespace oryx {

/// Upper bound on parallel workers for one evaluation.
inline constexpr std::size_t kMaxWorkers = 8;

/// Per-table source configuration.
struct TableOptions {
    /// First line of the file holds column names.
    bool have_header = true;
    /// Rows pulled from the source per batch.
    std::size_t batch_size = 300;
    char separator = ',';
};

}  // namespace oryx
