#include <oryx/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace oryx {

namespace {

auto read_digits(std::string_view text, std::size_t& pos, std::size_t max_width, int& out)
    -> bool {
    std::size_t end = pos;
    while (end < text.size() && end - pos < max_width && text[end] >= '0' && text[end] <= '9') {
        ++end;
    }
    if (end == pos) {
        return false;
    }
    auto result = std::from_chars(text.data() + pos, text.data() + end, out);
    if (result.ec != std::errc()) {
        return false;
    }
    pos = end;
    return true;
}

}  // namespace

auto parse_date(std::string_view text, std::string_view pattern) -> std::optional<Date> {
    int y = 1970;
    int m = 1;
    int d = 1;
    std::size_t pos = 0;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char ch = pattern[i];
        if (ch == '%' && i + 1 < pattern.size()) {
            char field = pattern[++i];
            bool ok = false;
            switch (field) {
                case 'Y':
                    ok = read_digits(text, pos, 4, y);
                    break;
                case 'm':
                    ok = read_digits(text, pos, 2, m);
                    break;
                case 'd':
                    ok = read_digits(text, pos, 2, d);
                    break;
                case '%':
                    ok = pos < text.size() && text[pos++] == '%';
                    break;
                default:
                    return std::nullopt;
            }
            if (!ok) {
                return std::nullopt;
            }
            continue;
        }
        if (pos >= text.size() || text[pos] != ch) {
            return std::nullopt;
        }
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    using namespace std::chrono;
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(sys_days{ymd}.time_since_epoch().count())};
}

auto format_date(Date date, std::string_view pattern) -> std::string {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{date.days}}};
    std::string out;
    out.reserve(pattern.size() + 4);
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        char ch = pattern[i];
        if (ch == '%' && i + 1 < pattern.size()) {
            char field = pattern[++i];
            switch (field) {
                case 'Y':
                    out += fmt::format("{:04}", static_cast<int>(ymd.year()));
                    break;
                case 'm':
                    out += fmt::format("{:02}", static_cast<unsigned>(ymd.month()));
                    break;
                case 'd':
                    out += fmt::format("{:02}", static_cast<unsigned>(ymd.day()));
                    break;
                default:
                    out.push_back(field);
                    break;
            }
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

}  // namespace oryx
