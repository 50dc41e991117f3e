/*
 * rate_governor.cpp  Oct 3rd, 2026
 *
 * Exponential backoff and global cooldown for the catalog api
 *
 */

#include "tcf/rate_governor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace tcf {

RateGovernor::RateGovernor(RateConfig cfg, NowFn now)
  : cfg_(std::move(cfg)), now_(std::move(now))
{
  if ( cfg_.backoff_factor < 1.0 ) {
    throw std::invalid_argument("tcf::RateGovernor backoff_factor must be >= 1");
  }
  if ( cfg_.ceiling < cfg_.floor ) {
    throw std::invalid_argument("tcf::RateGovernor ceiling below floor");
  }
  if ( !now_ ) {
    now_ = [] { return clock::now(); };
  }
  state_.current_delay = cfg_.floor;
}

/************ delay_before_next_request() *****************/
/* The next request may start once the pacing slot and any cooldown have
 * both passed. The slot is reserved here, so concurrent callers queue up
 * behind each other instead of all firing when the cooldown ends.
 *
 * We return:
 *   How long the caller must wait before issuing its request
 */
millis
RateGovernor::delay_before_next_request()
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_();
  return std::chrono::ceil<millis>(reserve_slot_(now) - now);
}

/************ wait_turn() *********************************/
/* Suspends until the reserved slot and the cooldown have both passed.
 * A cooldown that begins while we sleep wakes us, and we queue again
 * behind it.
 *
 * We return:
 *   false if the stop token fired first, in which case the caller must not
 *   issue the request
 */
bool
RateGovernor::wait_turn(std::stop_token token)
{
  std::unique_lock<std::mutex> lock(mu_);
  auto slot = reserve_slot_(now_());
  uint64_t seen = escalations_;

  while ( !token.stop_requested() ) {
    const auto now = now_();
    if ( escalations_ != seen ) {
      seen = escalations_;
      slot = reserve_slot_(now);
    }

    const auto ready = std::max(slot, state_.cooldown_until);
    if ( now >= ready ) {
      return true;
    }

    const auto delay = std::chrono::ceil<millis>(ready - now);
    spdlog::debug("rate governor: waiting {} ms before request", delay.count());
    cv_.wait_for(lock, token, delay, [&] { return escalations_ != seen; });
  }
  return false;
}

/************ record_outcome() ****************************/
/* ok walks the failure counter back toward zero, throttling escalates
 * immediately and server errors escalate once they repeat. Client errors
 * say nothing about load and leave the state alone.
 */
void
RateGovernor::record_outcome(Outcome outcome)
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = now_();

  switch ( outcome ) {
    case Outcome::Ok:
      state_.consecutive_server_errors = 0;
      if ( state_.consecutive_failures > 0 ) {
        state_.consecutive_failures -= 1;
      }
      state_.current_delay = backoff_for_(state_.consecutive_failures);
      break;

    case Outcome::RateLimited:
      escalate_(now);
      cv_.notify_all();
      spdlog::warn("rate governor: throttled, {} consecutive, cooling down {} ms",
                   state_.consecutive_failures, state_.current_delay.count());
      break;

    case Outcome::ServerError:
      state_.consecutive_server_errors += 1;
      if ( state_.consecutive_server_errors >= cfg_.server_error_threshold ) {
        escalate_(now);
        cv_.notify_all();
        spdlog::warn("rate governor: repeated server errors, cooling down {} ms",
                     state_.current_delay.count());
      }
      break;

    case Outcome::ClientError:
      break;
  }
}

RateState
RateGovernor::state() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

/************ backoff_for_() ******************************/
/* floor at zero failures, base * factor^(n-1) after, capped at ceiling */
millis
RateGovernor::backoff_for_(size_t failures) const
{
  if ( failures == 0 ) {
    return cfg_.floor;
  }

  const double scaled = static_cast<double>(cfg_.base.count()) *
                        std::pow(cfg_.backoff_factor, static_cast<double>(failures - 1));
  const double capped = std::min(scaled, static_cast<double>(cfg_.ceiling.count()));
  const auto delay = millis(static_cast<millis::rep>(capped));
  return std::clamp(delay, cfg_.floor, cfg_.ceiling);
}

/************ reserve_slot_() *****************************/
/* Caller holds mu_. Hands out the earliest start at or after now that is
 * clear of the cooldown and of every earlier reservation
 */
RateGovernor::clock::time_point
RateGovernor::reserve_slot_(clock::time_point now)
{
  const auto start = std::max({now, next_slot_, state_.cooldown_until});
  next_slot_ = start + state_.current_delay;
  return start;
}

/* Reservations made before the cooldown are void, sleeping waiters take
 * fresh slots from its end */
void
RateGovernor::escalate_(clock::time_point now)
{
  state_.consecutive_failures += 1;
  state_.current_delay  = backoff_for_(state_.consecutive_failures);
  state_.cooldown_until = std::max(state_.cooldown_until, now + state_.current_delay);
  next_slot_ = state_.cooldown_until;
  escalations_ += 1;
}

} // end namespace tcf
