#ifndef CLARO_TIME_UTILS_HPP
#define CLARO_TIME_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace claro {

/**
 * @brief Broken-down wall-clock time (proleptic Gregorian calendar)
 */
struct CivilTime {
    int year = 1970;
    int month = 1;      // 1..12
    int day = 1;        // 1..31
    int hour = 0;       // 0..23
    int minute = 0;     // 0..59
    int second = 0;     // 0..59
};

/**
 * @brief Naive wall-clock timestamp, whole seconds since 1970-01-01 00:00:00
 *
 * Carries no time zone. Offset-aware text is resolved by the parser
 * (see TimeUtils::parse_iso8601) before a Timestamp is produced.
 */
class Timestamp {
public:
    Timestamp() = default;
    explicit Timestamp(int64_t seconds) : seconds_(seconds) {}

    static Timestamp from_civil(const CivilTime& ct);

    CivilTime to_civil() const;
    int64_t seconds() const { return seconds_; }

    Timestamp plus_seconds(int64_t s) const { return Timestamp(seconds_ + s); }
    Timestamp plus_minutes(int64_t m) const { return Timestamp(seconds_ + 60 * m); }

    /** Day of week, 0 = Monday ... 6 = Sunday. */
    int weekday() const;

    /** Day of year, 1-based (1 Jan = 1). */
    int day_of_year() const;

    /** Hour of day as hour + minute/60 (seconds ignored). */
    double hour_of_day() const;

    bool operator==(const Timestamp& o) const { return seconds_ == o.seconds_; }
    bool operator!=(const Timestamp& o) const { return seconds_ != o.seconds_; }
    bool operator<(const Timestamp& o) const { return seconds_ < o.seconds_; }
    bool operator<=(const Timestamp& o) const { return seconds_ <= o.seconds_; }

private:
    int64_t seconds_ = 0;
};

/**
 * @brief Result of parsing a timestamp string
 *
 * wall_clock is the time as written; utc_offset_minutes is set only when the
 * text carried a "Z" or "+HH:MM" suffix.
 */
struct ParsedTimestamp {
    Timestamp wall_clock;
    std::optional<int> utc_offset_minutes;

    /** Same instant expressed as naive UTC wall-clock time. */
    Timestamp to_utc() const;
};

/**
 * @brief Calendar conversions for the simulation time grid
 *
 * Day numbers use the Julian Day Number algorithm from the Astronomical
 * Almanac, shifted so that 1970-01-01 is day 0.
 */
class TimeUtils {
public:
    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = 3600;
    static constexpr int64_t SECONDS_PER_DAY = 86400;
    static constexpr int MINUTES_PER_DAY = 1440;

    // Julian Day Number of 1970-01-01
    static constexpr int64_t UNIX_EPOCH_JDN = 2440588;

    /**
     * @brief Days since 1970-01-01 for a civil date
     */
    static int64_t days_from_civil(int year, int month, int day);

    /**
     * @brief Inverse of days_from_civil
     */
    static void civil_from_days(int64_t days, int& year, int& month, int& day);

    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);

    /**
     * @brief Format as "YYYY-MM-DDTHH:MM:SS"
     * @param sep Separator between date and time ('T' or ' ')
     */
    static std::string format_iso8601(const Timestamp& ts, char sep = 'T');

    /**
     * @brief Format a UTC offset as "+HH:MM" / "-HH:MM"
     */
    static std::string format_utc_offset(int offset_minutes);

    /**
     * @brief Parse "YYYY-MM-DD" or "YYYY-MM-DD[T ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]"
     *
     * Leading/trailing whitespace is ignored. Fractional seconds are
     * accepted and truncated.
     * @return nullopt when the text is not a valid timestamp
     */
    static std::optional<ParsedTimestamp> parse_iso8601(const std::string& text);

    /**
     * @brief Parse "+HH:MM", "-HH:MM", "+HHMM", "Z" or "UTC"
     */
    static std::optional<int> parse_utc_offset(const std::string& text);
};

} // namespace claro

#endif // CLARO_TIME_UTILS_HPP
