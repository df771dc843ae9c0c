#include "time_utils.hpp"
#include <cstdio>

namespace rightv {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = static_cast<int>(y - era * 400);
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = static_cast<int>(z - era * 146097);
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe + era * 400) + (m <= 2);
}

int daysInMonth(int y, int m) {
    static constexpr int DAYS[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return (m == 2 && leap) ? 29 : DAYS[m - 1];
}

bool parseFixed(const std::string& s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

std::optional<std::int64_t> parseTimestamp(const std::string& ts) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (ts.size() < 10 || ts[4] != '-' || ts[7] != '-') return std::nullopt;
    if (!parseFixed(ts, 0, 4, year) || !parseFixed(ts, 5, 2, month) || !parseFixed(ts, 8, 2, day))
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    if (ts.size() > 10) {
        // Time part after 'T' or ' '; ':' or '_' separators (Databento-style names use '_').
        if (ts[10] != 'T' && ts[10] != ' ') return std::nullopt;
        if (!parseFixed(ts, 11, 2, hour)) return std::nullopt;
        if (ts.size() < 16 || (ts[13] != ':' && ts[13] != '_') || !parseFixed(ts, 14, 2, minute))
            return std::nullopt;
        if (ts.size() >= 19 && (ts[16] == ':' || ts[16] == '_') && !parseFixed(ts, 17, 2, second))
            return std::nullopt;
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }
    return daysFromCivil(year, month, day) * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
}

std::int64_t dayNumber(std::int64_t epoch_seconds) {
    std::int64_t d = epoch_seconds / SECONDS_PER_DAY;
    if (epoch_seconds % SECONDS_PER_DAY < 0) --d;
    return d;
}

int hourOfDay(std::int64_t epoch_seconds) {
    std::int64_t secs = epoch_seconds - dayNumber(epoch_seconds) * SECONDS_PER_DAY;
    return static_cast<int>(secs / 3600);
}

std::string formatTimestamp(std::int64_t epoch_seconds) {
    std::int64_t days = dayNumber(epoch_seconds);
    std::int64_t secs = epoch_seconds - days * SECONDS_PER_DAY;
    int y, m, d;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", y, m, d,
                  static_cast<int>(secs / 3600), static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60));
    return std::string(buf);
}

} // namespace rightv
