#pragma once

#include <string>
#include <cstdint>

namespace ghostmeter {
namespace timestamp {

/// Parse an ISO-like date/time string into UTC epoch seconds.
/// Accepted: "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS[.fff]",
/// with 'T' instead of the space. A time may carry 'Z' or a UTC offset
/// ("+01:00", "-0500", "+02"), which is subtracted to give UTC.
/// Throws std::invalid_argument on anything else.
double parse(const std::string& text);

/// Non-throwing variant of parse()
bool try_parse(const std::string& text, double& out);

/// Day of year (1..366) of the calendar date as written, 1 when missing or unparseable
int day_of_year(const std::string& date);

/// Calendar minute index of an epoch time
int64_t minute_key(double epoch_seconds);

/// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int year, int month, int day);

} // namespace timestamp
} // namespace ghostmeter
