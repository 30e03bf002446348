#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace oryx {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Default pattern for the `date` type tag.
inline constexpr std::string_view kDefaultDatePattern = "%Y-%m-%d";

/// Parse `text` against a pattern made of literal characters and the
/// `%Y`, `%m`, `%d` fields. Returns nullopt on mismatch or an invalid date.
[[nodiscard]] auto parse_date(std::string_view text,
                              std::string_view pattern = kDefaultDatePattern)
    -> std::optional<Date>;

/// Render a date with the same pattern language as parse_date().
[[nodiscard]] auto format_date(Date date, std::string_view pattern = kDefaultDatePattern)
    -> std::string;

}  // namespace oryx

namespace std {

template <>
struct hash<oryx::Date> {
    auto operator()(const oryx::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

}  // namespace std
