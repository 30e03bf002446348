#include <oryx/core/value.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <functional>

namespace oryx {

namespace {

template <typename T>
auto three_way(const T& lhs, const T& rhs) -> int {
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

auto kind_name(ValueKind kind) -> std::string_view {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::String:
            return "string";
        case ValueKind::Date:
            return "date";
    }
    return "unknown";
}

auto as_double(const Value& value) -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* date = std::get_if<Date>(&value)) {
        return static_cast<double>(date->days);
    }
    return std::nullopt;
}

auto compare_values(const Value& lhs, const Value& rhs) -> int {
    auto lk = kind_of(lhs);
    auto rk = kind_of(rhs);
    if (lk == rk) {
        switch (lk) {
            case ValueKind::Null:
                return 0;
            case ValueKind::Int:
                return three_way(std::get<std::int64_t>(lhs), std::get<std::int64_t>(rhs));
            case ValueKind::Double:
                return three_way(std::get<double>(lhs), std::get<double>(rhs));
            case ValueKind::String:
                return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));
            case ValueKind::Date:
                return three_way(std::get<Date>(lhs).days, std::get<Date>(rhs).days);
        }
    }
    bool lnum = lk == ValueKind::Int || lk == ValueKind::Double;
    bool rnum = rk == ValueKind::Int || rk == ValueKind::Double;
    if (lnum && rnum) {
        return three_way(*as_double(lhs), *as_double(rhs));
    }
    return three_way(static_cast<int>(lk), static_cast<int>(rk));
}

auto compare_tuples(std::span<const Value> lhs, std::span<const Value> rhs) -> int {
    std::size_t n = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (int c = compare_values(lhs[i], rhs[i]); c != 0) {
            return c;
        }
    }
    return three_way(lhs.size(), rhs.size());
}

auto to_text(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return std::to_string(v);
            }
        },
        value);
}

auto encode_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "n";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("i{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                // Round-trip precision.
                return fmt::format("f{}", v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return fmt::format("t{}", v.days);
            } else {
                return "s" + v;
            }
        },
        value);
}

auto decode_value(std::string_view text) -> std::optional<Value> {
    if (text.empty()) {
        return std::nullopt;
    }
    auto body = text.substr(1);
    switch (text.front()) {
        case 'n':
            return Value{};
        case 's':
            return Value{std::string(body)};
        case 'i': {
            std::int64_t v = 0;
            if (!try_parse_int(body, v)) {
                return std::nullopt;
            }
            return Value{v};
        }
        case 't': {
            std::int64_t v = 0;
            if (!try_parse_int(body, v)) {
                return std::nullopt;
            }
            return Value{Date{static_cast<std::int32_t>(v)}};
        }
        case 'f': {
            std::string owned(body);
            char* end = nullptr;
            double v = std::strtod(owned.c_str(), &end);
            if (end == owned.c_str() || *end != '\0') {
                return std::nullopt;
            }
            return Value{v};
        }
        default:
            return std::nullopt;
    }
}

auto TupleHash::operator()(const std::vector<Value>& key) const noexcept -> std::size_t {
    std::size_t seed = key.size();
    for (const auto& value : key) {
        std::size_t h = std::visit(
            [](const auto& v) -> std::size_t {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return 0;
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    // Hash integral values through double so 2 and 2.0 collide,
                    // matching compare_values().
                    return std::hash<double>{}(static_cast<double>(v));
                } else {
                    return std::hash<T>{}(v);
                }
            },
            value);
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

}  // namespace oryx
