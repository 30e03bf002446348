#pragma once

#include <oryx/frame/dataframe.hpp>
#include <oryx/plan/join.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oryx {

/// Join of two frames.
///
/// Holds read-only references: both frames must outlive the join and must
/// not be mutated while it is planned or computed. The constructor validates
/// the join and dry-runs it over the first rows of both files.
class JoinedDataFrame {
   public:
    JoinedDataFrame(const DataFrame& left, const DataFrame& right, plan::JoinKind kind,
                    std::vector<plan::KeySpec> left_keys, std::vector<plan::KeySpec> right_keys,
                    plan::JoinOptions options = {},
                    std::optional<std::string> left_roll = std::nullopt,
                    std::optional<std::string> right_roll = std::nullopt);

    [[nodiscard]] auto kind() const noexcept -> plan::JoinKind { return planner_.kind(); }

    /// `<prefix>_<name>` for every live column of both sides.
    [[nodiscard]] auto col_names() const -> std::vector<std::string>;

    [[nodiscard]] auto plan(const std::optional<std::vector<std::string>>& select = std::nullopt)
        const -> plan::Plan;

    [[nodiscard]] auto preview(std::size_t sample_size = 10, std::size_t return_size = 10,
                               bool format = true) const -> runtime::PreviewResult;

    auto compute(const ComputeOptions& options, runtime::ExecutionBackend* backend = nullptr) const
        -> runtime::ExecutionReport;

   private:
    /// Frames in planner order (swapped for right joins).
    const DataFrame* left_;
    const DataFrame* right_;
    plan::JoinPlanner planner_;
};

[[nodiscard]] auto inner_join(const DataFrame& left, const DataFrame& right,
                              std::vector<plan::KeySpec> left_keys,
                              std::vector<plan::KeySpec> right_keys,
                              plan::JoinOptions options = {}) -> JoinedDataFrame;

/// Every left row, null-padded where the right side has no match.
[[nodiscard]] auto left_join(const DataFrame& left, const DataFrame& right,
                             std::vector<plan::KeySpec> left_keys,
                             std::vector<plan::KeySpec> right_keys,
                             plan::JoinOptions options = {}) -> JoinedDataFrame;

/// Left join with the sides and prefixes swapped: right columns come first.
[[nodiscard]] auto right_join(const DataFrame& left, const DataFrame& right,
                              std::vector<plan::KeySpec> left_keys,
                              std::vector<plan::KeySpec> right_keys,
                              plan::JoinOptions options = {}) -> JoinedDataFrame;

/// As-of join to the nearest right row with `right_roll >= left_roll`.
[[nodiscard]] auto rolling_join_forward(const DataFrame& left, const DataFrame& right,
                                        std::vector<plan::KeySpec> left_keys,
                                        std::vector<plan::KeySpec> right_keys,
                                        std::string left_roll, std::string right_roll,
                                        plan::JoinOptions options = {}) -> JoinedDataFrame;

/// As-of join to the nearest right row with `right_roll <= left_roll`.
[[nodiscard]] auto rolling_join_backward(const DataFrame& left, const DataFrame& right,
                                         std::vector<plan::KeySpec> left_keys,
                                         std::vector<plan::KeySpec> right_keys,
                                         std::string left_roll, std::string right_roll,
                                         plan::JoinOptions options = {}) -> JoinedDataFrame;

}  // namespace oryx
