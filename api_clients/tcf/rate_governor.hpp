/*
 * rate_governor.hpp  Oct 3rd, 2026
 *
 * Process wide pacing for the catalog api. Tracks consecutive failure
 * signals, derives the inter-request delay by bounded exponential backoff
 * and holds a global cooldown that every caller must respect.
 */

#ifndef __TCF_RATE_GOVERNOR_HPP
#define __TCF_RATE_GOVERNOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>

#include "fetch_support.hpp"

namespace tcf {

struct RateConfig {
  millis floor{0};                  // pacing with no outstanding failures
  millis base{1000};                // delay after the first failure signal
  double backoff_factor{2.0};       // multiplier per further failure
  millis ceiling{60000};            // hard cap on delay and cooldown
  size_t server_error_threshold{2}; // consecutive 5xx before they count
};

/* Snapshot of the governor's counters. Only RateGovernor mutates them */
struct RateState {
  size_t consecutive_failures{0};
  size_t consecutive_server_errors{0};
  millis current_delay{0};
  std::chrono::steady_clock::time_point cooldown_until{};
};

/************ tcf::RateGovernor ***************************/
/* Thread safe. Every read-modify-write happens under mu_ so a worker pool
 * can share one instance.
 *
 * delay_before_next_request() reserves the caller's slot and returns how
 * long it must wait. wait_turn() reserves and then sleeps, waking early when
 * the stop token fires or when another caller's outcome starts a cooldown.
 */
class RateGovernor {
public:
  using clock = std::chrono::steady_clock;
  using NowFn = std::function<clock::time_point()>;

  explicit RateGovernor(RateConfig cfg, NowFn now = {});

  millis delay_before_next_request();
  bool wait_turn(std::stop_token token);

  void record_outcome(Outcome outcome);

  RateState state() const;
  const RateConfig& config() const noexcept { return cfg_; }

private:
  RateConfig cfg_;
  NowFn now_;

  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  RateState state_{};
  clock::time_point next_slot_{};
  uint64_t escalations_{0}; // bumped per cooldown, wakes sleeping waiters

  clock::time_point reserve_slot_(clock::time_point now);
  millis backoff_for_(size_t failures) const;
  void escalate_(clock::time_point now);
};

} // end namespace tcf

#endif // !__TCF_RATE_GOVERNOR_HPP
