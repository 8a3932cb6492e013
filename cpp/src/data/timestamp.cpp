#include "ghostmeter/data/timestamp.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ghostmeter {
namespace timestamp {

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return days[month - 1];
}

/// Read exactly `width` digits starting at pos
bool read_digits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

int64_t days_from_civil(int year, int month, int day) {
    // Howard Hinnant's days_from_civil
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

namespace {

/// Fields of a parsed timestamp, in the local time of the string
struct Fields {
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    double fraction = 0.0;
    int offset_seconds = 0;     ///< UTC offset, subtracted to get UTC
};

/// Optional "Z" or UTC offset "+HH:MM", "+HHMM", "+HH" (or '-')
void parse_zone(const std::string& s, size_t& pos, const std::string& text, Fields& f) {
    if (expect(s, pos, 'Z')) {
        return;
    }
    if (pos >= s.size() || (s[pos] != '+' && s[pos] != '-')) {
        return;
    }
    const int sign = s[pos] == '-' ? -1 : 1;
    ++pos;

    int hours = 0, minutes = 0;
    if (!read_digits(s, pos, 2, hours)) {
        throw std::invalid_argument("Malformed UTC offset: " + text);
    }
    if (expect(s, pos, ':')) {
        if (!read_digits(s, pos, 2, minutes)) {
            throw std::invalid_argument("Malformed UTC offset: " + text);
        }
    } else if (pos < s.size() && !read_digits(s, pos, 2, minutes)) {
        throw std::invalid_argument("Malformed UTC offset: " + text);
    }
    if (hours > 23 || minutes > 59) {
        throw std::invalid_argument("UTC offset out of range: " + text);
    }
    f.offset_seconds = sign * (hours * 3600 + minutes * 60);
}

Fields parse_fields(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        throw std::invalid_argument("Empty timestamp");
    }

    Fields f;
    size_t pos = 0;
    if (!read_digits(s, pos, 4, f.year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, f.month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, f.day)) {
        throw std::invalid_argument("Malformed date: " + text);
    }
    if (f.month < 1 || f.month > 12 || f.day < 1 || f.day > days_in_month(f.year, f.month)) {
        throw std::invalid_argument("Date out of range: " + text);
    }

    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        ++pos;
        if (!read_digits(s, pos, 2, f.hour) || !expect(s, pos, ':') ||
            !read_digits(s, pos, 2, f.minute)) {
            throw std::invalid_argument("Malformed time: " + text);
        }
        if (expect(s, pos, ':')) {
            if (!read_digits(s, pos, 2, f.second)) {
                throw std::invalid_argument("Malformed seconds: " + text);
            }
            if (expect(s, pos, '.')) {
                double scale = 0.1;
                size_t digits = 0;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                    f.fraction += (s[pos] - '0') * scale;
                    scale /= 10.0;
                    ++pos;
                    ++digits;
                }
                if (digits == 0) {
                    throw std::invalid_argument("Malformed fraction: " + text);
                }
            }
        }
        if (f.hour > 23 || f.minute > 59 || f.second > 60) {
            throw std::invalid_argument("Time out of range: " + text);
        }
        parse_zone(s, pos, text, f);
    } else {
        expect(s, pos, 'Z');
    }

    if (pos != s.size()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + text);
    }
    return f;
}

} // namespace

double parse(const std::string& text) {
    const Fields f = parse_fields(text);
    const int64_t days = days_from_civil(f.year, f.month, f.day);
    return static_cast<double>(days) * 86400.0 +
           f.hour * 3600.0 + f.minute * 60.0 + f.second + f.fraction -
           f.offset_seconds;
}

bool try_parse(const std::string& text, double& out) {
    try {
        out = parse(text);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

int day_of_year(const std::string& date) {
    if (date.empty()) {
        return 1;
    }
    try {
        // Calendar date as written, regardless of UTC offset
        const Fields f = parse_fields(date);
        return static_cast<int>(days_from_civil(f.year, f.month, f.day) -
                                days_from_civil(f.year, 1, 1)) + 1;
    } catch (const std::invalid_argument&) {
        return 1;
    }
}

int64_t minute_key(double epoch_seconds) {
    return static_cast<int64_t>(std::floor(epoch_seconds / 60.0));
}

} // namespace timestamp
} // namespace ghostmeter
