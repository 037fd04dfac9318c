#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: duration.hpp
    MODULE: core
    PURPOSE: Human-readable duration strings ("2s", "1m 30s", "250ms") to and from
            std::chrono::nanoseconds.
*/


#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "sbg/core/result.hpp"

namespace sbg
{
    using Duration = std::chrono::nanoseconds;

    inline double duration_seconds(Duration d)
    {
        return std::chrono::duration<double>(d).count();
    }

    inline Duration duration_from_seconds(double seconds)
    {
        return Duration((int64_t)std::llround(seconds * 1e9));
    }

    namespace detail
    {
        inline int64_t duration_unit_ns(std::string_view unit)
        {
            if (unit == "ns" || unit == "nsec" || unit == "nanos") return 1;
            if (unit == "us" || unit == "usec" || unit == "micros") return 1000;
            if (unit == "ms" || unit == "msec" || unit == "millis") return 1000000;
            if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds")
                return 1000000000LL;
            if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes")
                return 60LL * 1000000000LL;
            if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours")
                return 3600LL * 1000000000LL;
            if (unit == "d" || unit == "day" || unit == "days")
                return 86400LL * 1000000000LL;
            return 0;
        }

        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
        inline bool is_space(char c) { return c == ' ' || c == '\t'; }
    }

    // Accepts a sum of <number><unit> terms, e.g. "1h 2m", "1.5s", "500ms".
    // A bare "0" is the only unitless value accepted.
    inline Result<Duration> parse_duration(std::string_view text)
    {
        auto fail = [&](const std::string& why)
        {
            return Result<Duration>::failure(make_error(
                ErrorKind::Config, ErrorCode::InvalidDuration,
                "invalid duration '" + std::string(text) + "': " + why));
        };

        size_t i = 0;
        while (i < text.size() && detail::is_space(text[i])) ++i;
        size_t end = text.size();
        while (end > i && detail::is_space(text[end - 1])) --end;
        const std::string_view body = text.substr(i, end - i);
        if (body.empty()) return fail("empty");
        if (body == "0") return Result<Duration>::success(Duration::zero());

        int64_t total = 0;
        size_t p = 0;
        while (p < body.size())
        {
            while (p < body.size() && detail::is_space(body[p])) ++p;
            if (p >= body.size()) break;

            const size_t num_begin = p;
            while (p < body.size() && detail::is_digit(body[p])) ++p;
            const std::string_view int_part = body.substr(num_begin, p - num_begin);
            std::string_view frac_part{};
            if (p < body.size() && body[p] == '.')
            {
                ++p;
                const size_t frac_begin = p;
                while (p < body.size() && detail::is_digit(body[p])) ++p;
                frac_part = body.substr(frac_begin, p - frac_begin);
            }
            if (int_part.empty() && frac_part.empty()) return fail("expected a number");

            while (p < body.size() && detail::is_space(body[p])) ++p;
            const size_t unit_begin = p;
            while (p < body.size() && detail::is_alpha(body[p])) ++p;
            const std::string_view unit = body.substr(unit_begin, p - unit_begin);
            if (unit.empty()) return fail("missing unit");
            const int64_t scale = detail::duration_unit_ns(unit);
            if (scale == 0) return fail("unknown unit '" + std::string(unit) + "'");

            constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
            int64_t whole = 0;
            for (char c : int_part)
            {
                const int64_t digit = (int64_t)(c - '0');
                if (whole > (kMax - digit) / 10) return fail("value too large");
                whole = whole * 10 + digit;
            }
            if (whole > kMax / scale) return fail("value too large");
            int64_t term = whole * scale;

            int64_t frac_scale = scale;
            for (char c : frac_part)
            {
                frac_scale /= 10;
                if (frac_scale == 0) break;
                // term + digit * frac_scale stays below (whole + 1) * scale.
                const int64_t part = (int64_t)(c - '0') * frac_scale;
                if (term > kMax - part) return fail("value too large");
                term += part;
            }

            if (total > kMax - term) return fail("value too large");
            total += term;
        }
        return Result<Duration>::success(Duration(total));
    }

    // Canonical form, largest unit first: "0s", "2s", "1m 30s", "1s 500ms".
    inline std::string format_duration(Duration d)
    {
        int64_t ns = d.count();
        if (ns <= 0) return "0s";

        struct Unit { const char* suffix; int64_t ns; };
        static constexpr Unit kUnits[] = {
            {"d", 86400LL * 1000000000LL},
            {"h", 3600LL * 1000000000LL},
            {"m", 60LL * 1000000000LL},
            {"s", 1000000000LL},
            {"ms", 1000000LL},
            {"us", 1000LL},
            {"ns", 1LL},
        };

        std::string out{};
        for (const Unit& u : kUnits)
        {
            const int64_t n = ns / u.ns;
            if (n == 0) continue;
            ns -= n * u.ns;
            if (!out.empty()) out += ' ';
            out += std::to_string(n);
            out += u.suffix;
        }
        return out;
    }
}
