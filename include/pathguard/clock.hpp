#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace pathguard {

// Source of the token inserted by timestamp rotation.
// Must be safe to call from several threads at once.
using TimestampClock = std::function<std::string()>;

// Always returns the same token
TimestampClock fixed_clock(std::string token);

// Formats the current UTC time with a strftime pattern ("%Y-%m-%d")
TimestampClock utc_clock(std::string format);

// Format a point in time as UTC with a strftime pattern.
// Returns an empty string when the pattern produces no output.
std::string format_utc(std::chrono::system_clock::time_point when, const std::string& format);

} // namespace pathguard
