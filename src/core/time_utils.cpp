#include "core/time_utils.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace claro {

namespace {

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
    return a - floor_div(a, b) * b;
}

// Reads exactly n digits at pos; advances pos on success.
bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; i++) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += n;
    return true;
}

bool read_char(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        pos++;
        return true;
    }
    return false;
}

// Offset body after the sign: "HH:MM" or "HHMM" or "HH".
bool read_offset_body(const std::string& s, size_t& pos, int& minutes) {
    int hh = 0, mm = 0;
    if (!read_digits(s, pos, 2, hh)) return false;
    if (read_char(s, pos, ':')) {
        if (!read_digits(s, pos, 2, mm)) return false;
    } else if (pos < s.size()) {
        if (!read_digits(s, pos, 2, mm)) return false;
    }
    if (hh > 23 || mm > 59) return false;
    minutes = hh * 60 + mm;
    return true;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Timestamp
// ═══════════════════════════════════════════════════════════════

Timestamp Timestamp::from_civil(const CivilTime& ct) {
    int64_t days = TimeUtils::days_from_civil(ct.year, ct.month, ct.day);
    return Timestamp(days * TimeUtils::SECONDS_PER_DAY
                     + ct.hour * TimeUtils::SECONDS_PER_HOUR
                     + ct.minute * TimeUtils::SECONDS_PER_MINUTE
                     + ct.second);
}

CivilTime Timestamp::to_civil() const {
    CivilTime ct;
    int64_t days = floor_div(seconds_, TimeUtils::SECONDS_PER_DAY);
    int64_t rem = seconds_ - days * TimeUtils::SECONDS_PER_DAY;

    TimeUtils::civil_from_days(days, ct.year, ct.month, ct.day);
    ct.hour = static_cast<int>(rem / TimeUtils::SECONDS_PER_HOUR);
    rem %= TimeUtils::SECONDS_PER_HOUR;
    ct.minute = static_cast<int>(rem / TimeUtils::SECONDS_PER_MINUTE);
    ct.second = static_cast<int>(rem % TimeUtils::SECONDS_PER_MINUTE);
    return ct;
}

int Timestamp::weekday() const {
    // JDN mod 7 is 0 on Mondays
    int64_t days = floor_div(seconds_, TimeUtils::SECONDS_PER_DAY);
    return static_cast<int>(floor_mod(days + TimeUtils::UNIX_EPOCH_JDN, 7));
}

int Timestamp::day_of_year() const {
    int64_t days = floor_div(seconds_, TimeUtils::SECONDS_PER_DAY);
    int y, m, d;
    TimeUtils::civil_from_days(days, y, m, d);
    return static_cast<int>(days - TimeUtils::days_from_civil(y, 1, 1)) + 1;
}

double Timestamp::hour_of_day() const {
    CivilTime ct = to_civil();
    return ct.hour + ct.minute / 60.0;
}

Timestamp ParsedTimestamp::to_utc() const {
    if (!utc_offset_minutes) return wall_clock;
    return wall_clock.plus_minutes(-*utc_offset_minutes);
}

// ═══════════════════════════════════════════════════════════════
// Calendar arithmetic
// ═══════════════════════════════════════════════════════════════

int64_t TimeUtils::days_from_civil(int year, int month, int day) {
    // Julian Day Number (Astronomical Almanac), valid for all Gregorian
    // dates after 4801 BC
    int64_t a = (14 - month) / 12;
    int64_t y = static_cast<int64_t>(year) + 4800 - a;
    int64_t m = month + 12 * a - 3;

    int64_t jdn = day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
    return jdn - UNIX_EPOCH_JDN;
}

void TimeUtils::civil_from_days(int64_t days, int& year, int& month, int& day) {
    // Richards' algorithm, JDN -> Gregorian
    int64_t J = days + UNIX_EPOCH_JDN;
    int64_t f = J + 1401 + (((4 * J + 274277) / 146097) * 3) / 4 - 38;
    int64_t e = 4 * f + 3;
    int64_t g = (e % 1461) / 4;
    int64_t h = 5 * g + 2;

    day = static_cast<int>((h % 153) / 5 + 1);
    month = static_cast<int>(((h / 153 + 2) % 12) + 1);
    year = static_cast<int>(e / 1461 - 4716 + (12 + 2 - month) / 12);
}

bool TimeUtils::is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int TimeUtils::days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

// ═══════════════════════════════════════════════════════════════
// Formatting / parsing
// ═══════════════════════════════════════════════════════════════

std::string TimeUtils::format_iso8601(const Timestamp& ts, char sep) {
    CivilTime ct = ts.to_civil();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d%c%02d:%02d:%02d",
                  ct.year, ct.month, ct.day, sep, ct.hour, ct.minute, ct.second);
    return std::string(buf);
}

std::string TimeUtils::format_utc_offset(int offset_minutes) {
    char sign = offset_minutes < 0 ? '-' : '+';
    int a = std::abs(offset_minutes);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, a / 60, a % 60);
    return std::string(buf);
}

std::optional<ParsedTimestamp> TimeUtils::parse_iso8601(const std::string& text) {
    const std::string s = trim(text);
    size_t pos = 0;
    CivilTime ct;

    if (!read_digits(s, pos, 4, ct.year)) return std::nullopt;
    if (!read_char(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, ct.month)) return std::nullopt;
    if (!read_char(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, ct.day)) return std::nullopt;

    if (ct.month < 1 || ct.month > 12) return std::nullopt;
    if (ct.day < 1 || ct.day > days_in_month(ct.year, ct.month)) return std::nullopt;

    ParsedTimestamp out;

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return std::nullopt;
        pos++;

        if (!read_digits(s, pos, 2, ct.hour)) return std::nullopt;
        if (!read_char(s, pos, ':')) return std::nullopt;
        if (!read_digits(s, pos, 2, ct.minute)) return std::nullopt;
        if (read_char(s, pos, ':')) {
            if (!read_digits(s, pos, 2, ct.second)) return std::nullopt;
            if (read_char(s, pos, '.')) {
                size_t frac_start = pos;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
                if (pos == frac_start) return std::nullopt;
            }
        }
        if (ct.hour > 23 || ct.minute > 59 || ct.second > 59) return std::nullopt;

        if (pos < s.size()) {
            char c = s[pos++];
            int minutes = 0;
            if (c == 'Z') {
                out.utc_offset_minutes = 0;
            } else if (c == '+' || c == '-') {
                if (!read_offset_body(s, pos, minutes)) return std::nullopt;
                out.utc_offset_minutes = (c == '-') ? -minutes : minutes;
            } else {
                return std::nullopt;
            }
        }
    }

    if (pos != s.size()) return std::nullopt;

    out.wall_clock = Timestamp::from_civil(ct);
    return out;
}

std::optional<int> TimeUtils::parse_utc_offset(const std::string& text) {
    const std::string s = trim(text);
    if (s == "Z" || s == "UTC") return 0;
    if (s.size() < 3 || (s[0] != '+' && s[0] != '-')) return std::nullopt;

    size_t pos = 1;
    int minutes = 0;
    if (!read_offset_body(s, pos, minutes) || pos != s.size()) return std::nullopt;
    return s[0] == '-' ? -minutes : minutes;
}

} // namespace claro
