#pragma once

#include <oryx/plan/plan.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace oryx::runtime {

struct PreviewResult {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

/// Evaluate a plan in memory over the first `sample_size` records of each
/// input and return up to `return_size` output rows as text.
///
/// Any failure (malformed record, throwing user function or aggregator) ends
/// the dry run and is returned as the error message. `format` applies the
/// deferred formatters of aggregate and join outputs; select plans carry their
/// formatters in the plan itself.
[[nodiscard]] auto preview(const plan::Plan& plan, std::size_t sample_size = 10,
                           std::size_t return_size = 10, bool format = true)
    -> std::expected<PreviewResult, std::string>;

/// Render a preview as an aligned text table.
[[nodiscard]] auto render_preview(const PreviewResult& result) -> std::string;

}  // namespace oryx::runtime
