#include <relsync/feed/rfc2822.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <regex>
#include <string>

namespace relsync::feed {

namespace {

constexpr std::array<const char*, 12> kMonths = {"jan", "feb", "mar", "apr", "may", "jun",
                                                 "jul", "aug", "sep", "oct", "nov", "dec"};
// Indexed by weekday::c_encoding()
constexpr std::array<const char*, 7> kWeekdays = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int> monthIndex(const std::string& name) {
    auto l = lower(name);
    for (std::size_t i = 0; i < kMonths.size(); ++i) {
        if (l == kMonths[i])
            return static_cast<int>(i) + 1;
    }
    return std::nullopt;
}

// Offset from UTC in minutes
std::optional<int> zoneOffsetMinutes(const std::string& zone) {
    if (zone.size() == 5 && (zone[0] == '+' || zone[0] == '-')) {
        int hh = std::stoi(zone.substr(1, 2));
        int mm = std::stoi(zone.substr(3, 2));
        if (mm > 59)
            return std::nullopt;
        int total = hh * 60 + mm;
        return zone[0] == '-' ? -total : total;
    }
    auto z = lower(zone);
    if (z == "gmt" || z == "ut" || z == "utc" || z == "z")
        return 0;
    if (z == "edt")
        return -4 * 60;
    if (z == "est" || z == "cdt")
        return -5 * 60;
    if (z == "cst" || z == "mdt")
        return -6 * 60;
    if (z == "mst" || z == "pdt")
        return -7 * 60;
    if (z == "pst")
        return -8 * 60;
    return std::nullopt;
}

} // namespace

std::optional<TimePoint> parseRfc2822(std::string_view text) {
    static const std::regex rfc2822Regex(
        R"(^\s*(?:([A-Za-z]{3})\s*,\s*)?(\d{1,2})\s+([A-Za-z]{3})\s+(\d{2,4})\s+(\d{1,2}):(\d{2})(?::(\d{2}))?\s+([A-Za-z]{1,5}|[+-]\d{4})\s*$)");

    const std::string input(text);
    std::smatch match;
    if (!std::regex_match(input, match, rfc2822Regex)) {
        spdlog::trace("rfc2822: '{}' does not match the date grammar", input);
        return std::nullopt;
    }

    std::optional<unsigned> dayOfWeek;
    if (match[1].matched) {
        auto wd = lower(match[1].str());
        auto it = std::find_if(kWeekdays.begin(), kWeekdays.end(),
                               [&wd](const char* name) { return wd == name; });
        if (it == kWeekdays.end())
            return std::nullopt;
        dayOfWeek = static_cast<unsigned>(it - kWeekdays.begin());
    }

    auto month = monthIndex(match[3].str());
    if (!month)
        return std::nullopt;

    int year = std::stoi(match[4].str());
    if (match[4].length() == 2) {
        year += year < 50 ? 2000 : 1900;
    } else if (match[4].length() == 3) {
        year += 1900;
    }

    const int dayOfMonth = std::stoi(match[2].str());
    const int hour = std::stoi(match[5].str());
    const int minute = std::stoi(match[6].str());
    const int second = match[7].matched ? std::stoi(match[7].str()) : 0;
    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    auto offset = zoneOffsetMinutes(match[8].str());
    if (!offset)
        return std::nullopt;

    using namespace std::chrono;
    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(*month)},
                             std::chrono::day{static_cast<unsigned>(dayOfMonth)}};
    if (!ymd.ok())
        return std::nullopt;
    // The day name, when present, must agree with the date as written.
    if (dayOfWeek && weekday{sys_days{ymd}}.c_encoding() != *dayOfWeek) {
        spdlog::trace("rfc2822: '{}' names the wrong day of week", input);
        return std::nullopt;
    }

    auto tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second} - minutes{*offset};
    return time_point_cast<system_clock::duration>(tp);
}

std::string formatRfc2822(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::array<char, 64> buf{};
    const auto n = std::strftime(buf.data(), buf.size(), "%a, %d %b %Y %H:%M:%S +0000", &tm);
    return std::string(buf.data(), n);
}

} // namespace relsync::feed
