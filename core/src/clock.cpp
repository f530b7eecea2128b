#include "courtline/clock.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace courtline::clock {

namespace {
bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Reads \d+ starting at pos; advances pos. Fails past kMaxClockNumber.
bool read_digits(std::string_view text, size_t& pos, long long& value) {
  const size_t start = pos;
  value = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    value = value * 10 + (text[pos] - '0');
    if (value > kMaxClockNumber) return false;
    ++pos;
  }
  return pos > start;
}

std::optional<int> to_int_seconds(long long seconds) {
  if (seconds > std::numeric_limits<int>::max()) return std::nullopt;
  return static_cast<int>(seconds);
}

// Reads \d+(\.\d+)? starting at pos; advances pos.
bool read_decimal(std::string_view text, size_t& pos, double& value) {
  long long whole = 0;
  if (!read_digits(text, pos, whole)) return false;
  value = static_cast<double>(whole);
  if (pos < text.size() && text[pos] == '.') {
    size_t frac_pos = pos + 1;
    double scale = 0.1;
    double frac = 0.0;
    const size_t frac_start = frac_pos;
    while (frac_pos < text.size() && is_digit(text[frac_pos])) {
      frac += (text[frac_pos] - '0') * scale;
      scale *= 0.1;
      ++frac_pos;
    }
    if (frac_pos == frac_start) return false;
    value += frac;
    pos = frac_pos;
  }
  return true;
}
} // namespace

bool parse_pt_duration(std::string_view text, double& seconds) {
  if (text.size() < 2 || text.substr(0, 2) != "PT") return false;
  size_t pos = 2;
  double minutes = 0.0;
  double secs = 0.0;

  // Minutes group: \d+M
  size_t probe = pos;
  long long whole = 0;
  if (read_digits(text, probe, whole) && probe < text.size() && text[probe] == 'M') {
    minutes = static_cast<double>(whole);
    pos = probe + 1;
  }

  // Seconds group: \d+(\.\d+)?S
  if (pos < text.size()) {
    probe = pos;
    double value = 0.0;
    if (!read_decimal(text, probe, value) || probe >= text.size() || text[probe] != 'S') {
      return false;
    }
    secs = value;
    pos = probe + 1;
  }

  if (pos != text.size()) return false;
  seconds = minutes * 60.0 + secs;
  return true;
}

int period_length(int period) {
  return period <= kRegulationPeriods ? kRegulationPeriodSeconds : kOvertimePeriodSeconds;
}

int period_start_elapsed(int period) {
  if (period <= kRegulationPeriods) {
    return (period - 1) * kRegulationPeriodSeconds;
  }
  return kRegulationPeriods * kRegulationPeriodSeconds + (period - kRegulationPeriods - 1) * kOvertimePeriodSeconds;
}

int period_end_elapsed(int period) {
  return period_start_elapsed(period) + period_length(period);
}

std::string period_start_clock(int period) {
  return period <= kRegulationPeriods ? "PT12M00.00S" : "PT05M00.00S";
}

bool to_elapsed(int period, std::string_view clock, int& elapsed) {
  if (period < 1 || period > kMaxPeriod) return false;
  double remaining = 0.0;
  if (!parse_pt_duration(clock, remaining)) return false;
  const double length = static_cast<double>(period_length(period));
  remaining = std::clamp(remaining, 0.0, length);
  elapsed = period_start_elapsed(period) + static_cast<int>(length - remaining);
  return true;
}

std::optional<int> parse_minutes(std::string_view text) {
  if (text.empty()) return std::nullopt;
  if (text.substr(0, 2) == "PT") {
    double seconds = 0.0;
    if (!parse_pt_duration(text, seconds)) return std::nullopt;
    return to_int_seconds(static_cast<long long>(seconds));
  }
  size_t pos = 0;
  long long minutes = 0;
  if (!read_digits(text, pos, minutes)) return std::nullopt;
  if (pos == text.size()) {
    return to_int_seconds(minutes * 60);
  }
  if (text[pos] != ':') return std::nullopt;
  ++pos;
  long long seconds = 0;
  if (!read_digits(text, pos, seconds) || pos != text.size()) return std::nullopt;
  return to_int_seconds(minutes * 60 + seconds);
}

} // namespace courtline::clock
