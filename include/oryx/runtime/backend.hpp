#pragma once

#include <oryx/plan/plan.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace oryx::runtime {

/// Per-evaluation settings handed to a backend.
struct ExecutionOptions {
    /// Parallel workers, 1..kMaxWorkers.
    std::size_t num_workers = 1;
    std::filesystem::path output_path;
    /// Abort on the first failing record instead of reporting it.
    bool raise_on_error = false;
    /// Write output rows in input order.
    bool preserve_order = true;
    /// Scratch directory for spill files; default_work_dir() when empty.
    std::filesystem::path work_dir;
};

/// A record (or group) that could not be evaluated.
struct RowFailure {
    std::uint64_t row_id = 0;
    /// Source file of the record, or "group" for a failed group reduction.
    std::string source;
    std::string message;
};

struct ExecutionReport {
    std::size_t rows_read = 0;
    std::size_t rows_written = 0;
    std::vector<RowFailure> failures;

    [[nodiscard]] auto ok() const noexcept -> bool { return failures.empty(); }
};

/// Executes frozen plans. Implementations write the header row before any
/// data row and never drop failing records silently.
class ExecutionBackend {
   public:
    virtual ~ExecutionBackend() = default;

    [[nodiscard]] virtual auto execute(const plan::Plan& plan, const ExecutionOptions& options)
        -> std::expected<ExecutionReport, std::string> = 0;
};

/// In-process backend: batches evaluated on worker threads, grouped
/// aggregates spilled per group to the work directory, joins built into an
/// in-memory hash index.
class LocalBackend final : public ExecutionBackend {
   public:
    auto execute(const plan::Plan& plan, const ExecutionOptions& options)
        -> std::expected<ExecutionReport, std::string> override;
};

/// `$ORYX_WORK_DIR`, else `<temp>/oryx`.
[[nodiscard]] auto default_work_dir() -> std::filesystem::path;

}  // namespace oryx::runtime
