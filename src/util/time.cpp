#include "fieldsync/util/time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fieldsync {

Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

Clock system_clock() {
    return [] { return now(); };
}

Clock fixed_clock(Timestamp at) {
    return [at] { return at; };
}

std::string to_iso8601(Timestamp ts) {
    auto ms = to_millis(ts);
    auto millis = ms % 1000;
    auto secs = static_cast<std::time_t>(ms / 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

namespace {

bool read_int(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    auto first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc{} && ptr == first + len;
}

int days_in_month(int year, int month) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : days[month - 1];
}

} // anonymous namespace

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 20) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm{};
    int year = 0, month = 0;
    if (!read_int(text, 0, 4, year) || !read_int(text, 5, 2, month) ||
        !read_int(text, 8, 2, tm.tm_mday) || !read_int(text, 11, 2, tm.tm_hour) ||
        !read_int(text, 14, 2, tm.tm_min) || !read_int(text, 17, 2, tm.tm_sec)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || tm.tm_mday < 1 || tm.tm_mday > days_in_month(year, month) ||
        tm.tm_hour < 0 || tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 ||
        tm.tm_sec < 0 || tm.tm_sec > 59) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;

    int millis = 0;
    size_t pos = 19;
    if (text[pos] == '.') {
        if (!read_int(text, pos + 1, 3, millis) || millis < 0) return std::nullopt;
        pos += 4;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') return std::nullopt;

    auto secs = timegm(&tm);
    return from_millis(static_cast<int64_t>(secs) * 1000 + millis);
}

} // namespace fieldsync
