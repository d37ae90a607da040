#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

// Upper bound keeps every duration representable in nanosecond clocks
static constexpr double MAX_DURATION_MS = 100.0 * 365 * 86400 * 1000;

std::optional<Millis> parse_duration(const std::string& text) {
    if (text == "0") return Millis(0);
    if (text.empty()) return std::nullopt;

    double total_ms = 0.0;
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        bool seen_dot = false;
        while (i < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[i])) || (text[i] == '.' && !seen_dot))) {
            if (text[i] == '.') seen_dot = true;
            i++;
        }
        if (i == start) return std::nullopt;

        double value;
        try {
            value = std::stod(text.substr(start, i - start));
        } catch (const std::exception&) {
            return std::nullopt;
        }

        size_t unit_start = i;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) i++;
        std::string unit = text.substr(unit_start, i - unit_start);

        double scale;
        if (unit == "ms")      scale = 1.0;
        else if (unit == "s")  scale = 1000.0;
        else if (unit == "m")  scale = 60.0 * 1000.0;
        else if (unit == "h")  scale = 3600.0 * 1000.0;
        else if (unit == "d")  scale = 86400.0 * 1000.0;
        else return std::nullopt;

        total_ms += value * scale;
        if (total_ms > MAX_DURATION_MS) return std::nullopt;
    }
    return Millis(static_cast<Millis::rep>(std::llround(total_ms)));
}

std::string format_duration(Millis d) {
    auto ms = d.count();
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    } else if (ms < 60 * 1000) {
        return fmt::format("{:.1f}s", ms / 1000.0);
    }
    return fmt::format("{:.1f}m", ms / 60000.0);
}

std::string format_iso(TimePoint t) {
    auto ms_total = std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms_total / 1000);
    int ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) { ms += 1000; secs -= 1; }

    struct tm tm_buf;
    gmtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}Z", buf, ms);
}

std::optional<TimePoint> parse_iso(const std::string& text) {
    struct tm tm_buf = {};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    int ms = 0;
    const char* rest = text.c_str() + consumed;
    if (*rest == '.') {
        rest++;
        int digits = 0;
        while (std::isdigit(static_cast<unsigned char>(*rest))) {
            if (digits < 3) ms = ms * 10 + (*rest - '0');
            digits++;
            rest++;
        }
        for (; digits < 3; digits++) ms *= 10;
    }
    if (*rest != '\0' && *rest != 'Z') return std::nullopt;

    std::time_t secs = timegm(&tm_buf);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::seconds(secs) + Millis(ms)));
}

std::string format_file_stamp(TimePoint t) {
    std::time_t secs = Clock::to_time_t(t);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return std::string(buf);
}

std::string format_timestamp(TimePoint t) {
    std::time_t secs = Clock::to_time_t(t);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);

    // Format as "8:13pm" (12-hour with am/pm)
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    // Strip leading zero and lowercase am/pm: "08:13PM" → "8:13pm"
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}
