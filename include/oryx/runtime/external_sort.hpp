#pragma once

#include <oryx/core/options.hpp>
#include <oryx/plan/sort.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

namespace oryx::runtime {

struct SortOptions {
    /// Records sorted in memory per run.
    std::size_t chunk_rows = 100000;
    /// Scratch directory for runs; default_work_dir() when empty.
    std::filesystem::path work_dir;
    TableOptions table;
};

/// Bounded-memory sort of a delimited file.
///
/// The input is cut into runs of `chunk_rows` records, each run is sorted in
/// memory and spilled, and the runs are k-way merged into the output. Input
/// that fits in one run is written directly. Ties may come out in any order.
class ExternalSorter {
   public:
    ExternalSorter(plan::RowComparator comparator, SortOptions options);

    /// Sort `input` into `output` (header first when the input has one).
    /// Returns the number of data records written.
    [[nodiscard]] auto sort_file(const std::filesystem::path& input,
                                 const std::filesystem::path& output)
        -> std::expected<std::size_t, std::string>;

   private:
    plan::RowComparator comparator_;
    SortOptions options_;
};

}  // namespace oryx::runtime
