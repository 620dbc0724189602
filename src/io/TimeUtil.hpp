#pragma once
#include <cstdint>
#include <string>

// Seconds between the Unix epoch and the FIT epoch (1989-12-31T00:00:00Z).
constexpr double kFitEpochOffset = 631065600.0;

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d);

// xsd:dateTime ("2019-06-01T07:30:00Z", "...T07:30:00.250+02:00", or with no
// zone, read as UTC) -> Unix seconds. Throws DecodeError when malformed.
double parse_iso8601(const std::string &text);

// Unix seconds -> "YYYY-MM-DDTHH:MM:SSZ" (fraction dropped).
std::string format_iso8601(double unix_seconds);
