#pragma once

#include <relsync/core/types.h>

#include <bitset>
#include <optional>
#include <string>
#include <string_view>

namespace relsync::schedule {

inline constexpr const char* kDefaultCronExpression = "*/20 * * * * * *";

/**
 * Seconds-resolution cron expression.
 *
 * Fields: second minute hour day-of-month month day-of-week [year]. Each field accepts "*",
 * numbers, "a-b" ranges, steps ("0/15", "1-30/5", or "/n" after "*") and comma lists. Months
 * and weekdays also accept three-letter names. "?" is a synonym for "*" in the two day
 * fields. Day-of-week 0 and 7 are both Sunday. When both day fields are restricted a day
 * matches if either one does.
 */
class CronSchedule {
public:
    static constexpr int kMinYear = 1970;
    static constexpr int kMaxYear = 2099;

    static Result<CronSchedule> parse(std::string_view expression);

    /**
     * First matching instant strictly after `after`, in local time. nullopt when nothing
     * matches before the end of kMaxYear.
     */
    [[nodiscard]] std::optional<TimePoint> next(TimePoint after) const;

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

private:
    CronSchedule() = default;

    bool dayMatches(int year, unsigned month, unsigned day) const;

    std::string expression_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    std::bitset<kMaxYear - kMinYear + 1> years_;
    bool domRestricted_{false};
    bool dowRestricted_{false};
};

} // namespace relsync::schedule
