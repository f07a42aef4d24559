#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dca {
namespace domain {

// -----------------------------------------------------------------------------
// Frequency — fixed execution cadences
// -----------------------------------------------------------------------------
// Monthly is a nominal 30-day month, not a calendar month.
// -----------------------------------------------------------------------------
enum class Frequency {
  Hourly,
  Daily,
  Weekly,
  Monthly,
};

constexpr std::int64_t kSecondsPerDay = 86400;

constexpr std::int64_t frequencySeconds(Frequency f) {
  switch (f) {
    case Frequency::Hourly:  return 3600;
    case Frequency::Daily:   return kSecondsPerDay;
    case Frequency::Weekly:  return 7 * kSecondsPerDay;
    case Frequency::Monthly: return 30 * kSecondsPerDay;
  }
  return 0;
}

inline const char* frequencyToString(Frequency f) {
  switch (f) {
    case Frequency::Hourly:  return "Hourly";
    case Frequency::Daily:   return "Daily";
    case Frequency::Weekly:  return "Weekly";
    case Frequency::Monthly: return "Monthly";
  }
  return "Unknown";
}

// Parses the names produced by frequencyToString(). Returns nullopt for
// anything else so callers can report InvalidSchedule.
inline std::optional<Frequency> frequencyFromString(const std::string& name) {
  if (name == "Hourly") return Frequency::Hourly;
  if (name == "Daily") return Frequency::Daily;
  if (name == "Weekly") return Frequency::Weekly;
  if (name == "Monthly") return Frequency::Monthly;
  return std::nullopt;
}

}  // namespace domain
}  // namespace dca
