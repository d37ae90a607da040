#pragma once

#include <string>
#include <optional>
#include "types.hpp"

// Parse a duration such as "1h30m": one or more <number><unit> groups, where unit is
// ms, s, m, h or d and number may carry a fraction ("1.5h", "1h30m", "500ms").
// A bare "0" is accepted. Returns nullopt on any other input, or when the
// total exceeds 100 years.
std::optional<Millis> parse_duration(const std::string& text);

// Human-readable duration: "250ms", "4.2s", "12.5m".
std::string format_duration(Millis d);

// RFC 3339 UTC timestamp with milliseconds: "2025-01-15T14:35:22.120Z".
std::string format_iso(TimePoint t);

// Inverse of format_iso. Also accepts timestamps without the fraction.
std::optional<TimePoint> parse_iso(const std::string& text);

// Local "YYYYmmdd_HHMMSS" stamp used in report file names.
std::string format_file_stamp(TimePoint t);

// Local wall-clock time as "2:35pm".
std::string format_timestamp(TimePoint t);
