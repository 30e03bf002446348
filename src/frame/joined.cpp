#include <oryx/core/error.hpp>
#include <oryx/frame/joined.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace oryx {

namespace {

auto checked(const DataFrame& frame) -> const DataFrame& {
    if (frame.is_aggregate()) {
        throw SchemaError(fmt::format("cannot join {}: it carries group-by or aggregate specs",
                                      frame.path().string()));
    }
    return frame;
}

}  // namespace

JoinedDataFrame::JoinedDataFrame(const DataFrame& left, const DataFrame& right,
                                 plan::JoinKind kind, std::vector<plan::KeySpec> left_keys,
                                 std::vector<plan::KeySpec> right_keys, plan::JoinOptions options,
                                 std::optional<std::string> left_roll,
                                 std::optional<std::string> right_roll)
    : left_(&checked(left)),
      right_(&checked(right)),
      planner_(left.catalog(), right.catalog(), kind, std::move(left_keys), std::move(right_keys),
               std::move(options), std::move(left_roll), std::move(right_roll)) {
    if (planner_.swapped()) {
        std::swap(left_, right_);
    }
    auto dry = runtime::preview(plan(), 10, 10, true);
    if (!dry) {
        throw OperationError(fmt::format("{} join of {} and {} (original error: {})",
                                         plan::join_kind_name(kind), left.path().string(),
                                         right.path().string(), dry.error()));
    }
    spdlog::debug("{} join of {} and {}{}", plan::join_kind_name(kind), left.path().string(),
                  right.path().string(), planner_.swapped() ? " (sides swapped)" : "");
}

auto JoinedDataFrame::col_names() const -> std::vector<std::string> {
    return planner_.output_names();
}

auto JoinedDataFrame::plan(const std::optional<std::vector<std::string>>& select) const
    -> plan::Plan {
    return plan::JoinPlan{
        .left = plan::make_table_plan(left_->path(), left_->options(), left_->catalog(),
                                      left_->rows(), false),
        .right = plan::make_table_plan(right_->path(), right_->options(), right_->catalog(),
                                       right_->rows(), false),
        .layout = planner_.layout(select, left_->file_size(), right_->file_size())};
}

auto JoinedDataFrame::preview(std::size_t sample_size, std::size_t return_size, bool format) const
    -> runtime::PreviewResult {
    auto result = runtime::preview(plan(), sample_size, return_size, format);
    if (!result) {
        throw OperationError(fmt::format("preview failed (original error: {})", result.error()));
    }
    return std::move(*result);
}

auto JoinedDataFrame::compute(const ComputeOptions& options,
                              runtime::ExecutionBackend* backend) const
    -> runtime::ExecutionReport {
    auto select = resolve_selection(options, col_names());
    return run_plan(plan(select), options, backend);
}

auto inner_join(const DataFrame& left, const DataFrame& right,
                std::vector<plan::KeySpec> left_keys, std::vector<plan::KeySpec> right_keys,
                plan::JoinOptions options) -> JoinedDataFrame {
    return JoinedDataFrame(left, right, plan::JoinKind::Inner, std::move(left_keys),
                           std::move(right_keys), std::move(options));
}

auto left_join(const DataFrame& left, const DataFrame& right,
               std::vector<plan::KeySpec> left_keys, std::vector<plan::KeySpec> right_keys,
               plan::JoinOptions options) -> JoinedDataFrame {
    return JoinedDataFrame(left, right, plan::JoinKind::Left, std::move(left_keys),
                           std::move(right_keys), std::move(options));
}

auto right_join(const DataFrame& left, const DataFrame& right,
                std::vector<plan::KeySpec> left_keys, std::vector<plan::KeySpec> right_keys,
                plan::JoinOptions options) -> JoinedDataFrame {
    return JoinedDataFrame(left, right, plan::JoinKind::Right, std::move(left_keys),
                           std::move(right_keys), std::move(options));
}

auto rolling_join_forward(const DataFrame& left, const DataFrame& right,
                          std::vector<plan::KeySpec> left_keys,
                          std::vector<plan::KeySpec> right_keys, std::string left_roll,
                          std::string right_roll, plan::JoinOptions options) -> JoinedDataFrame {
    return JoinedDataFrame(left, right, plan::JoinKind::AsofForward, std::move(left_keys),
                           std::move(right_keys), std::move(options), std::move(left_roll),
                           std::move(right_roll));
}

auto rolling_join_backward(const DataFrame& left, const DataFrame& right,
                           std::vector<plan::KeySpec> left_keys,
                           std::vector<plan::KeySpec> right_keys, std::string left_roll,
                           std::string right_roll, plan::JoinOptions options) -> JoinedDataFrame {
    return JoinedDataFrame(left, right, plan::JoinKind::AsofBackward, std::move(left_keys),
                           std::move(right_keys), std::move(options), std::move(left_roll),
                           std::move(right_roll));
}

}  // namespace oryx
