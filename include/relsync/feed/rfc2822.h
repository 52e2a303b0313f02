#pragma once

#include <relsync/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace relsync::feed {

/**
 * Parse an RFC 2822 date-time ("Mon, 01 Jan 2024 00:00:00 GMT").
 *
 * The day-of-week prefix and seconds are optional. Zones: GMT, UT, UTC, Z, the US zones
 * (EST/EDT/CST/CDT/MST/MDT/PST/PDT) and numeric +HHMM/-HHMM offsets. Two-digit years below 50
 * map to 20xx, others to 19xx. Returns nullopt on any malformed input.
 */
std::optional<TimePoint> parseRfc2822(std::string_view text);

/**
 * Render a time point as RFC 2822 in UTC, e.g. "Mon, 01 Jan 2024 00:00:00 +0000".
 */
std::string formatRfc2822(TimePoint tp);

} // namespace relsync::feed
