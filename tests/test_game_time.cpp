#include <iostream>

#include "superint/core/game_time.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_game_time() {
  using superint::Date;
  using superint::GameTime;

  auto d = Date::from_ymd(2025, 1, 1);
  SI_ASSERT(d.days_since_epoch() == 0);
  SI_ASSERT(d.to_string() == "2025-01-01");

  auto d2 = Date::parse_iso_ymd("2025-12-31");
  auto ymd = d2.to_ymd();
  SI_ASSERT(ymd.year == 2025);
  SI_ASSERT(ymd.month == 12);
  SI_ASSERT(ymd.day == 31);
  SI_ASSERT(d2.add_days(1).to_string() == "2026-01-01");

  // Leap day.
  SI_ASSERT(Date::from_ymd(2028, 2, 28).add_days(1).to_string() == "2028-02-29");

  SI_ASSERT(superint::quarter_of_month(1) == 1);
  SI_ASSERT(superint::quarter_of_month(3) == 1);
  SI_ASSERT(superint::quarter_of_month(4) == 2);
  SI_ASSERT(superint::quarter_of_month(12) == 4);

  // One default turn is 90 days: Jan 1 -> Apr 1.
  GameTime t;
  GameTime next = superint::advance_game_time(t);
  SI_ASSERT(next.year == 2025);
  SI_ASSERT(next.month == 4);
  SI_ASSERT(next.day == 1);
  SI_ASSERT(next.quarter == 2);
  SI_ASSERT(next.days_passed == 90);

  // Four turns later we are in the next year.
  for (int i = 0; i < 3; ++i) next = superint::advance_game_time(next);
  SI_ASSERT(next.year == 2025);
  SI_ASSERT(next.quarter == 4);
  next = superint::advance_game_time(next);
  SI_ASSERT(next.year == 2026);
  SI_ASSERT(next.quarter == 1);

  // Higher compression means shorter turns.
  SI_ASSERT(superint::time_scale_for_compression(1.0) == 90);
  SI_ASSERT(superint::time_scale_for_compression(2.0) == 45);
  SI_ASSERT(superint::time_scale_for_compression(1.15) == 78);
  SI_ASSERT(superint::time_scale_for_compression(5.0) == 18);
  SI_ASSERT(superint::time_scale_for_compression(50.0) == 18);
  SI_ASSERT(superint::time_scale_for_compression(0.1) == 90);

  // The step is time_scale days; the factor itself is only bookkeeping.
  GameTime fast;
  fast.compression_factor = 2.0;
  fast.time_scale = 45;
  SI_ASSERT(superint::advance_game_time(fast).days_passed == 45);
  fast.time_scale = 0;
  SI_ASSERT(superint::advance_game_time(fast).days_passed == 1);

  return 0;
}
