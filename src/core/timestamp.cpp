#include "emp/timestamp.hpp"

#include <cstdio>

namespace emp {

namespace {

bool read_digits(std::string_view text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size())
        return false;
    int value = 0;
    for (size_t i = 0; i < count; i++) {
        char c = text[pos + i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c)
        return false;
    ++pos;
    return true;
}

} // namespace

Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;

    auto day = floor<days>(ts);
    year_month_day ymd{day};
    hh_mm_ss hms{ts - day};
    long long micros = hms.subseconds().count();

    char buffer[48];
    int n = std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02lld:%02lld:%02lld",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<long long>(hms.hours().count()),
        static_cast<long long>(hms.minutes().count()),
        static_cast<long long>(hms.seconds().count()));

    std::string out(buffer, n);
    if (micros != 0) {
        if (micros % 1000 == 0)
            n = std::snprintf(buffer, sizeof(buffer), ".%03lld", micros / 1000);
        else
            n = std::snprintf(buffer, sizeof(buffer), ".%06lld", micros);
        out.append(buffer, n);
    }
    out.push_back('Z');
    return out;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    using namespace std::chrono;

    size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, pos, 4, y) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, mo) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, d))
        return std::nullopt;

    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't'))
        return std::nullopt;
    ++pos;

    if (!read_digits(text, pos, 2, h) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, mi) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, s))
        return std::nullopt;

    if (h > 23 || mi > 59 || s > 59)
        return std::nullopt;

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6)
                micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9)
            return std::nullopt;
        for (size_t i = digits; i < 6; i++)
            micros *= 10;
    }

    minutes offset{0};
    if (pos >= text.size())
        return std::nullopt;
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') || !read_digits(text, pos, 2, om))
            return std::nullopt;
        if (oh > 18 || om > 59)
            return std::nullopt;
        offset = minutes{sign * (oh * 60 + om)};
    } else {
        return std::nullopt;
    }

    if (pos != text.size())
        return std::nullopt;

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return std::nullopt;

    Timestamp ts = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + microseconds{micros};
    return ts - offset;
}

} // namespace emp
