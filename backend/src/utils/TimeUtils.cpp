#include "TimeUtils.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace std::chrono;

namespace {

    struct Split {
        std::time_t secs;
        milliseconds rem;
    };

    // floor-split so that pre-epoch values keep a non-negative remainder
    Split split(TimePoint tp) {
        auto ms = duration_cast<milliseconds>(tp.time_since_epoch());
        auto secs = duration_cast<seconds>(ms);
        if (secs > ms) secs -= seconds(1);
        return { static_cast<std::time_t>(secs.count()), ms - duration_cast<milliseconds>(secs) };
    }

    TimePoint join(std::time_t secs, milliseconds rem) {
        return TimePoint(duration_cast<system_clock::duration>(seconds(secs) + rem));
    }

    std::tm localTm(std::time_t t) {
        std::tm out{};
        localtime_r(&t, &out);
        return out;
    }

    // days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant)
    long long daysFromCivil(long long y, unsigned m, unsigned d) {
        y -= m <= 2;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }
}

namespace TimeUtils {

    TimePoint addDays(TimePoint tp, int days) {
        Split s = split(tp);
        std::tm t = localTm(s.secs);
        t.tm_mday += days;
        t.tm_isdst = -1;
        return join(std::mktime(&t), s.rem);
    }

    TimePoint addMonths(TimePoint tp, int months) {
        Split s = split(tp);
        std::tm t = localTm(s.secs);
        t.tm_mon += months;
        t.tm_isdst = -1;
        return join(std::mktime(&t), s.rem);
    }

    TimePoint endOfDay(TimePoint tp) {
        Split s = split(tp);
        std::tm t = localTm(s.secs);
        t.tm_hour = 23;
        t.tm_min = 59;
        t.tm_sec = 59;
        t.tm_isdst = -1;
        return join(std::mktime(&t), milliseconds(999));
    }

    std::string dateKey(TimePoint tp) {
        std::tm t = localTm(split(tp).secs);
        std::ostringstream oss;
        oss << std::put_time(&t, "%Y-%m-%d");
        return oss.str();
    }

    std::string toIso(TimePoint tp) {
        Split s = split(tp);
        std::tm t{};
        gmtime_r(&s.secs, &t);

        std::ostringstream oss;
        oss << std::put_time(&t, "%Y-%m-%dT%H:%M:%S")
            << "." << std::setw(3) << std::setfill('0') << s.rem.count() << "Z";
        return oss.str();
    }

    std::optional<TimePoint> fromIso(const std::string& text) {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
            &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        std::size_t pos = static_cast<std::size_t>(consumed);
        long long millis = 0;

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 3) millis = millis * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (int i = digits; i < 3; ++i) millis *= 10;
        }

        long long offset_minutes = 0;
        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            }
            else if (c == '+' || c == '-') {
                int oh = 0, om = 0;
                if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
                offset_minutes = (oh * 60 + om) * (c == '+' ? 1 : -1);
                pos += 6;
            }
            else {
                return std::nullopt;
            }
        }
        if (pos != text.size()) return std::nullopt;

        long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        long long secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
        long long ms = secs * 1000 + millis;

        // system_clock ticks are finer than milliseconds, so its range is narrower than the text's
        const long long min_ms = duration_cast<milliseconds>(TimePoint::min().time_since_epoch()).count();
        const long long max_ms = duration_cast<milliseconds>(TimePoint::max().time_since_epoch()).count();
        if (ms <= min_ms || ms >= max_ms) return std::nullopt;

        return fromEpochMillis(ms);
    }

    long long toEpochMillis(TimePoint tp) {
        return duration_cast<milliseconds>(tp.time_since_epoch()).count();
    }

    TimePoint fromEpochMillis(long long ms) {
        return TimePoint(duration_cast<system_clock::duration>(milliseconds(ms)));
    }

    TimePoint makeLocal(int year, int month, int day, int hour, int minute, int second) {
        std::tm t{};
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        t.tm_sec = second;
        t.tm_isdst = -1;
        return system_clock::from_time_t(std::mktime(&t));
    }
}
