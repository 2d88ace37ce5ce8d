#include "iso8601.hpp"

#include <cctype>
#include <format>

namespace iso8601 {

namespace {

bool read_digits(std::string_view s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

// YYYY-MM-DDTHH:MM:SS prefix.
bool looks_like_datetime(std::string_view s) {
    static constexpr std::string_view shape = "dddd-dd-ddTdd:dd:dd";
    if (s.size() < shape.size()) return false;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        } else if (s[i] != shape[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string format(TimePoint tp) {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::milliseconds>(tp));
}

std::optional<TimePoint> parse(std::string_view s) {
    if (!looks_like_datetime(s)) return std::nullopt;

    int y, mo, d, h, mi, sec;
    read_digits(s, 0, 4, y);
    read_digits(s, 5, 2, mo);
    read_digits(s, 8, 2, d);
    read_digits(s, 11, 2, h);
    read_digits(s, 14, 2, mi);
    read_digits(s, 17, 2, sec);

    std::chrono::year_month_day ymd{std::chrono::year(y), std::chrono::month(mo),
                                    std::chrono::day(d)};
    if (!ymd.ok() || h > 23 || mi > 59 || sec > 59) return std::nullopt;

    size_t pos = 19;
    int millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t start = pos;
        int scale = 100;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            millis += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    int offset_minutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = s[pos] == '-' ? -1 : 1;
            int oh, om;
            ++pos;
            if (!read_digits(s, pos, 2, oh)) return std::nullopt;
            pos += 2;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!read_digits(s, pos, 2, om)) return std::nullopt;
            pos += 2;
            if (oh > 23 || om > 59) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        }
    }
    if (pos != s.size()) return std::nullopt;

    TimePoint tp = std::chrono::sys_days(ymd);
    tp += std::chrono::hours(h) + std::chrono::minutes(mi) + std::chrono::seconds(sec) +
          std::chrono::milliseconds(millis);
    tp -= std::chrono::minutes(offset_minutes);
    return tp;
}

} // namespace iso8601
