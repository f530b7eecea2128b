#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace courtline::clock {

constexpr int kRegulationPeriods = 4;
constexpr int kRegulationPeriodSeconds = 720;
constexpr int kOvertimePeriodSeconds = 300;
// Four quarters plus sixteen overtimes; game records past this are rejected.
constexpr int kMaxPeriod = 20;
// Largest digit run accepted in a clock or minutes reading.
constexpr long long kMaxClockNumber = 1000000000LL;

// Parses "PT{mm}M{ss.ss}S" (either group optional) into seconds remaining.
// The whole string must match.
bool parse_pt_duration(std::string_view text, double& seconds);

// Seconds elapsed since tip-off for a countdown clock reading in `period`.
// Returns false for a period outside [1, kMaxPeriod] or a malformed clock.
bool to_elapsed(int period, std::string_view clock, int& elapsed);

// Period helpers expect 1 <= period <= kMaxPeriod.
int period_length(int period);
int period_start_elapsed(int period);
int period_end_elapsed(int period);
std::string period_start_clock(int period);

// Box-score minutes: "MM:SS", whole minutes "MM", or a PT duration. Totals
// that do not fit in an int are rejected.
std::optional<int> parse_minutes(std::string_view text);

} // namespace courtline::clock
