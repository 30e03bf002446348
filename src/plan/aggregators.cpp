#include <oryx/plan/aggregators.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>

namespace oryx::agg {

namespace {

auto numeric(const Value& value) -> double {
    auto d = as_double(value);
    if (!d || std::holds_alternative<Date>(value)) {
        throw std::invalid_argument(
            fmt::format("cannot aggregate {} value numerically", kind_name(kind_of(value))));
    }
    return *d;
}

auto extreme(std::span<const Value> values, int sign) -> Value {
    const Value* best = nullptr;
    for (const auto& v : values) {
        if (is_null(v)) {
            continue;
        }
        if (best == nullptr || compare_values(v, *best) * sign > 0) {
            best = &v;
        }
    }
    return best == nullptr ? Value{} : *best;
}

}  // namespace

auto sum() -> plan::Aggregator {
    return {.name = "sum", .reduce = [](std::span<const Value> values) -> Value {
                bool all_int = true;
                std::int64_t int_total = 0;
                double total = 0.0;
                for (const auto& v : values) {
                    if (is_null(v)) {
                        continue;
                    }
                    if (const auto* i = std::get_if<std::int64_t>(&v)) {
                        // An overflowing integer total degrades to the double total.
                        if (all_int && __builtin_add_overflow(int_total, *i, &int_total)) {
                            all_int = false;
                        }
                    } else {
                        all_int = false;
                    }
                    total += numeric(v);
                }
                if (all_int) {
                    return int_total;
                }
                return total;
            }};
}

auto mean() -> plan::Aggregator {
    return {.name = "mean", .reduce = [](std::span<const Value> values) -> Value {
                double total = 0.0;
                std::size_t n = 0;
                for (const auto& v : values) {
                    if (is_null(v)) {
                        continue;
                    }
                    total += numeric(v);
                    ++n;
                }
                if (n == 0) {
                    return Value{};
                }
                return total / static_cast<double>(n);
            }};
}

auto min() -> plan::Aggregator {
    return {.name = "min",
            .reduce = [](std::span<const Value> values) -> Value { return extreme(values, -1); }};
}

auto max() -> plan::Aggregator {
    return {.name = "max",
            .reduce = [](std::span<const Value> values) -> Value { return extreme(values, 1); }};
}

auto count() -> plan::Aggregator {
    return {.name = "count", .reduce = [](std::span<const Value> values) -> Value {
                return static_cast<std::int64_t>(values.size());
            }};
}

auto first() -> plan::Aggregator {
    return {.name = "first", .reduce = [](std::span<const Value> values) -> Value {
                return values.empty() ? Value{} : values.front();
            }};
}

auto last() -> plan::Aggregator {
    return {.name = "last", .reduce = [](std::span<const Value> values) -> Value {
                return values.empty() ? Value{} : values.back();
            }};
}

}  // namespace oryx::agg
