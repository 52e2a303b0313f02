#include <relsync/schedule/cron_schedule.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <vector>

namespace relsync::schedule {

namespace {

using namespace std::chrono;

constexpr std::array<std::string_view, 12> kMonthNames = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                                          "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr std::array<std::string_view, 7> kDayNames = {"SUN", "MON", "TUE", "WED",
                                                       "THU", "FRI", "SAT"};

struct FieldSpec {
    const char* name;
    int min;
    int max;
    // Value of the first entry in names, or 0 when the field has no names.
    int namesBase;
    const std::string_view* names;
    std::size_t nameCount;
    bool allowQuestion;
};

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        out.push_back(s.substr(start, pos == std::string_view::npos ? pos : pos - start));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

std::vector<std::string_view> splitWhitespace(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        std::size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > start)
            out.push_back(s.substr(start, i - start));
    }
    return out;
}

Error fieldError(const FieldSpec& spec, std::string_view token, std::string_view why) {
    return Error{ErrorCode::InvalidArgument, "cron " + std::string(spec.name) + " field '" +
                                                 std::string(token) + "': " + std::string(why)};
}

Result<int> parseValue(const FieldSpec& spec, std::string_view token) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec == std::errc() && ptr == token.data() + token.size()) {
        if (value < spec.min || value > spec.max)
            return fieldError(spec, token, "out of range");
        return value;
    }
    if (token.size() == 3) {
        std::string upper(token);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (std::size_t i = 0; i < spec.nameCount; ++i) {
            if (spec.names[i] == upper)
                return spec.namesBase + static_cast<int>(i);
        }
    }
    return fieldError(spec, token, "not a number");
}

// Parses one field into a vector of allowed values; returns whether the field is unrestricted.
Result<bool> parseField(const FieldSpec& spec, std::string_view field, std::vector<bool>& allowed) {
    allowed.assign(static_cast<std::size_t>(spec.max + 1), false);
    bool wildcard = false;

    for (auto item : split(field, ',')) {
        if (item.empty())
            return fieldError(spec, field, "empty list item");

        int step = 1;
        bool hasStep = false;
        if (auto slash = item.find('/'); slash != std::string_view::npos) {
            auto stepText = item.substr(slash + 1);
            auto [ptr, ec] =
                std::from_chars(stepText.data(), stepText.data() + stepText.size(), step);
            if (ec != std::errc() || ptr != stepText.data() + stepText.size() || step <= 0)
                return fieldError(spec, item, "invalid step");
            hasStep = true;
            item = item.substr(0, slash);
        }

        int lo = spec.min;
        int hi = spec.max;
        if (item == "*" || (item == "?" && spec.allowQuestion)) {
            if (!hasStep)
                wildcard = true;
        } else if (auto dash = item.find('-'); dash != std::string_view::npos) {
            auto a = parseValue(spec, item.substr(0, dash));
            if (!a)
                return a.error();
            auto b = parseValue(spec, item.substr(dash + 1));
            if (!b)
                return b.error();
            lo = a.value();
            hi = b.value();
            if (lo > hi)
                return fieldError(spec, item, "range start after end");
        } else {
            auto v = parseValue(spec, item);
            if (!v)
                return v.error();
            lo = v.value();
            // "a/n" runs from a to the end of the field.
            hi = hasStep ? spec.max : lo;
        }

        for (int v = lo; v <= hi; v += step)
            allowed[static_cast<std::size_t>(v)] = true;
    }
    return wildcard;
}

template <std::size_t N>
void assignBits(std::bitset<N>& bits, const std::vector<bool>& allowed) {
    bits.reset();
    for (std::size_t v = 0; v < allowed.size() && v < N; ++v) {
        if (allowed[v])
            bits.set(v);
    }
}

unsigned daysIn(int year, unsigned month) {
    auto last = year_month_day_last{std::chrono::year{year},
                                    month_day_last{std::chrono::month{month}}};
    return static_cast<unsigned>(last.day());
}

struct LocalFields {
    int year;
    unsigned month;
    unsigned day;
    int hour;
    int minute;
    int second;
};

LocalFields toLocal(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return {tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
            static_cast<unsigned>(tm.tm_mday), tm.tm_hour, tm.tm_min, tm.tm_sec};
}

std::time_t fromLocal(const LocalFields& f) {
    std::tm tm{};
    tm.tm_year = f.year - 1900;
    tm.tm_mon = static_cast<int>(f.month) - 1;
    tm.tm_mday = static_cast<int>(f.day);
    tm.tm_hour = f.hour;
    tm.tm_min = f.minute;
    tm.tm_sec = f.second;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

} // namespace

Result<CronSchedule> CronSchedule::parse(std::string_view expression) {
    auto fields = splitWhitespace(expression);
    if (fields.size() != 6 && fields.size() != 7) {
        return Error{ErrorCode::InvalidArgument,
                     "cron expression '" + std::string(expression) +
                         "' must have 6 or 7 fields, got " + std::to_string(fields.size())};
    }

    const FieldSpec specs[] = {
        {"second", 0, 59, 0, nullptr, 0, false},
        {"minute", 0, 59, 0, nullptr, 0, false},
        {"hour", 0, 23, 0, nullptr, 0, false},
        {"day-of-month", 1, 31, 0, nullptr, 0, true},
        {"month", 1, 12, 1, kMonthNames.data(), kMonthNames.size(), false},
        {"day-of-week", 0, 7, 0, kDayNames.data(), kDayNames.size(), true},
        {"year", kMinYear, kMaxYear, 0, nullptr, 0, false},
    };

    CronSchedule schedule;
    schedule.expression_ = std::string(expression);
    std::vector<bool> allowed;

    for (std::size_t i = 0; i < 7; ++i) {
        bool wildcard = true;
        if (i < fields.size()) {
            auto parsed = parseField(specs[i], fields[i], allowed);
            if (!parsed)
                return parsed.error();
            wildcard = parsed.value();
        } else {
            allowed.assign(static_cast<std::size_t>(kMaxYear + 1), false);
            std::fill(allowed.begin() + kMinYear, allowed.end(), true);
        }

        switch (i) {
            case 0:
                assignBits(schedule.seconds_, allowed);
                break;
            case 1:
                assignBits(schedule.minutes_, allowed);
                break;
            case 2:
                assignBits(schedule.hours_, allowed);
                break;
            case 3:
                assignBits(schedule.daysOfMonth_, allowed);
                schedule.domRestricted_ = !wildcard;
                break;
            case 4:
                assignBits(schedule.months_, allowed);
                break;
            case 5:
                if (allowed[7])
                    allowed[0] = true;
                allowed.resize(7);
                assignBits(schedule.daysOfWeek_, allowed);
                schedule.dowRestricted_ = !wildcard;
                break;
            case 6: {
                std::vector<bool> years(allowed.begin() + kMinYear, allowed.end());
                assignBits(schedule.years_, years);
                break;
            }
        }
    }
    return schedule;
}

bool CronSchedule::dayMatches(int year, unsigned month, unsigned day) const {
    using namespace std::chrono;
    const bool domOk = daysOfMonth_.test(day);
    const auto wd = weekday{sys_days{std::chrono::year{year} / std::chrono::month{month} /
                                     std::chrono::day{day}}}
                        .c_encoding();
    const bool dowOk = daysOfWeek_.test(wd);
    if (domRestricted_ && dowRestricted_)
        return domOk || dowOk;
    return domOk && dowOk;
}

std::optional<TimePoint> CronSchedule::next(TimePoint after) const {
    using namespace std::chrono;
    auto start = floor<seconds>(after) + seconds{1};
    auto f = toLocal(system_clock::to_time_t(start));

    auto resetTime = [&f] { f.hour = f.minute = f.second = 0; };
    auto nextDay = [&] {
        resetTime();
        if (++f.day > daysIn(f.year, f.month)) {
            f.day = 1;
            if (++f.month > 12) {
                f.month = 1;
                ++f.year;
            }
        }
    };

    while (f.year <= kMaxYear) {
        if (f.year < kMinYear || !years_.test(static_cast<std::size_t>(f.year - kMinYear))) {
            ++f.year;
            f.month = 1;
            f.day = 1;
            resetTime();
            continue;
        }
        if (!months_.test(f.month)) {
            f.day = 1;
            resetTime();
            if (++f.month > 12) {
                f.month = 1;
                ++f.year;
            }
            continue;
        }
        if (!dayMatches(f.year, f.month, f.day)) {
            nextDay();
            continue;
        }
        if (!hours_.test(static_cast<std::size_t>(f.hour))) {
            f.minute = f.second = 0;
            if (++f.hour > 23)
                nextDay();
            continue;
        }
        if (!minutes_.test(static_cast<std::size_t>(f.minute))) {
            f.second = 0;
            if (++f.minute > 59) {
                f.minute = 0;
                if (++f.hour > 23)
                    nextDay();
            }
            continue;
        }
        if (!seconds_.test(static_cast<std::size_t>(f.second))) {
            if (++f.second > 59) {
                f.second = 0;
                if (++f.minute > 59) {
                    f.minute = 0;
                    if (++f.hour > 23)
                        nextDay();
                }
            }
            continue;
        }

        auto candidate = system_clock::from_time_t(fromLocal(f));
        if (candidate > after)
            return candidate;
        // Local time folded back by a DST change; continue past the repeated hour.
        f = toLocal(system_clock::to_time_t(candidate + seconds{1}));
    }
    return std::nullopt;
}

} // namespace relsync::schedule
