#pragma once

#include <cstdint>
#include <string>

namespace superint {

// Calendar day counted from the campaign epoch (2025-01-01).
class Date {
 public:
  static Date from_ymd(int year, int month, int day);
  static Date parse_iso_ymd(const std::string& iso);

  Date() = default;
  explicit Date(std::int64_t days_since_epoch) : days_(days_since_epoch) {}

  std::int64_t days_since_epoch() const { return days_; }
  Date add_days(std::int64_t delta) const { return Date(days_ + delta); }

  struct YMD {
    int year;
    int month;
    int day;
  };

  YMD to_ymd() const;
  std::string to_string() const;

 private:
  std::int64_t days_{0};
};

// Calendar quarter (1-4) for a month (1-12).
int quarter_of_month(int month);

inline constexpr int kBaseTimeScale = 90;
inline constexpr double kMinTimeCompression = 1.0;
inline constexpr double kMaxTimeCompression = 5.0;

// Game-time fields carried by the meta slice.
struct GameTime {
  int year{2025};
  int quarter{1};
  int month{1};
  int day{1};
  int time_scale{kBaseTimeScale}; // days per turn
  // Grows as research completes; time_scale is kBaseTimeScale / factor.
  double compression_factor{1.0};
  std::int64_t days_passed{0};
};

// Advance by one turn's worth of days (time_scale, at least one).
GameTime advance_game_time(const GameTime& t);

// Days per turn for a compression factor, clamped to
// [kMinTimeCompression, kMaxTimeCompression].
int time_scale_for_compression(double factor);

} // namespace superint
