#include "fts/core/time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fts {
namespace {

bool read_digits(const std::string& text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool expect_char(const std::string& text, std::size_t pos, char expected) {
    return pos < text.size() && text[pos] == expected;
}

} // namespace

std::int64_t to_unix_millis(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Timestamp from_unix_millis(std::int64_t millis) {
    return Timestamp{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(millis));
}

std::string format_iso8601(Timestamp tp) {
    const auto millis_total = to_unix_millis(tp);
    auto seconds = millis_total / 1000;
    auto millis = millis_total % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    const std::time_t raw = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (millis != 0) {
        oss << '.' << std::setw(3) << std::setfill('0') << millis;
    }
    oss << 'Z';
    return oss.str();
}

Result<Timestamp> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    const bool layout_ok =
        read_digits(text, 0, 4, year) && expect_char(text, 4, '-') &&
        read_digits(text, 5, 2, month) && expect_char(text, 7, '-') &&
        read_digits(text, 8, 2, day) && expect_char(text, 10, 'T') &&
        read_digits(text, 11, 2, hour) && expect_char(text, 13, ':') &&
        read_digits(text, 14, 2, minute) && expect_char(text, 16, ':') &&
        read_digits(text, 17, 2, second);
    if (!layout_ok) {
        return Err<Timestamp>(Error::invalid_argument("Malformed timestamp: " + text));
    }

    std::size_t pos = 19;
    int millis = 0;
    if (expect_char(text, pos, '.')) {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return Err<Timestamp>(Error::invalid_argument("Malformed fractional seconds: " + text));
        }
        for (std::size_t i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    if (!expect_char(text, pos, 'Z') || pos + 1 != text.size()) {
        return Err<Timestamp>(Error::invalid_argument("Timestamp must be UTC (trailing 'Z'): " + text));
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return Err<Timestamp>(Error::invalid_argument("Timestamp field out of range: " + text));
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    const std::time_t seconds = timegm(&utc);

    return Ok(from_unix_millis(static_cast<std::int64_t>(seconds) * 1000 + millis));
}

} // namespace fts
