#include <oryx/plan/pipeline.hpp>

#include <fmt/format.h>

#include <utility>

namespace oryx::plan {

auto lift(UnaryFn fn) -> RowFn {
    return [fn = std::move(fn)](std::span<const Value> args) -> Value { return fn(args.front()); };
}

void OperationPipeline::set_formatter(std::size_t slot, Formatter formatter) {
    if (!formatter) {
        formatters_.erase(slot);
        return;
    }
    formatters_.insert_or_assign(slot, std::move(formatter));
}

auto OperationPipeline::finalize(const std::vector<bool>& live) const -> std::vector<Operation> {
    std::vector<Operation> out;
    out.reserve(operations_.size() + formatters_.size());
    out.insert(out.end(), operations_.begin(), operations_.end());
    for (const auto& [slot, formatter] : formatters_) {
        if (slot >= live.size() || !live[slot]) {
            continue;
        }
        out.push_back(Operation{.fn = lift(formatter),
                                .inputs = {slot},
                                .output = slot,
                                .label = fmt::format("format(#{})", slot)});
    }
    return out;
}

}  // namespace oryx::plan
